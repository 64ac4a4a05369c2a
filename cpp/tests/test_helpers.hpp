#ifndef FAND_TEST_HELPERS_HPP
#define FAND_TEST_HELPERS_HPP

#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fand/inputs.hpp"
#include "fand/outputs.hpp"

namespace fand_test {

inline int failures = 0;

inline void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

inline void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (!(std::fabs(value - expected) <= tolerance)) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

inline void expect_sequence(const std::vector<double>& values, const std::vector<double>& expected,
                            double tolerance, const std::string& message) {
    if (values.size() != expected.size()) {
        std::cerr << "FAIL: " << message << " (got " << values.size() << " values, expected " << expected.size()
                  << ")\n";
        failures += 1;
        return;
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        expect_near(values[i], expected[i], tolerance, message + " [" + std::to_string(i) + "]");
    }
}

// Polls `condition` until it holds or `timeout` elapses.
inline bool wait_for(const std::function<bool()>& condition,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Replays values and counts every pull, including pulls past the end.
class CountingSource : public fand::SampleSource {
public:
    explicit CountingSource(std::vector<double> values) : values_(std::move(values)) {}

    std::optional<double> next_sample() override {
        ++pulls;
        if (position_ >= values_.size()) {
            return std::nullopt;
        }
        return values_[position_++];
    }

    std::size_t pulls = 0;

private:
    std::vector<double> values_;
    std::size_t position_ = 0;
};

class RecordingSink : public fand::SampleSink {
public:
    void push(double value) override {
        values.push_back(value);
    }

    std::vector<double> values;
};

class FailingSink : public fand::SampleSink {
public:
    void push(double) override {
        throw std::runtime_error("actuator rejected value");
    }
};

inline int report() {
    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}

}  // namespace fand_test

#endif  // FAND_TEST_HELPERS_HPP
