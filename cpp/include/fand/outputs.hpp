#ifndef FAND_OUTPUTS_HPP
#define FAND_OUTPUTS_HPP

#include <memory>
#include <ostream>
#include <string>

#include "fand/config.hpp"
#include "fand/logging.hpp"

namespace fand {

// Receives the values the scheduler decided to forward. Implementations
// throw std::runtime_error when the actuator rejects a value.
class SampleSink {
public:
    virtual ~SampleSink() = default;
    virtual void push(double value) = 0;
};

// Drives a Linux sysfs PWM channel. Values are percentages of the period
// and are clamped to [0, 100].
class SysfsPwmOutput : public SampleSink {
public:
    SysfsPwmOutput(std::string chip = "/sys/class/pwm/pwmchip0", int channel = 0,
                   double frequency_hz = 20000.0, Logger logger = get_logger("SysfsPwmOutput"));
    ~SysfsPwmOutput() override;

    SysfsPwmOutput(const SysfsPwmOutput&) = delete;
    SysfsPwmOutput& operator=(const SysfsPwmOutput&) = delete;

    void push(double value) override;

    long long period_ns() const;

private:
    std::string attribute(const std::string& name) const;

    std::string chip_;
    int channel_ = 0;
    long long period_ns_ = 0;
    Logger logger_;
};

// Invokes `<command> <value>` through the shell for every forwarded value.
class CommandOutput : public SampleSink {
public:
    explicit CommandOutput(std::string command, Logger logger = get_logger("CommandOutput"));

    void push(double value) override;

private:
    std::string command_;
    Logger logger_;
};

class StdoutOutput : public SampleSink {
public:
    explicit StdoutOutput(std::ostream& stream);
    StdoutOutput();

    void push(double value) override;

private:
    std::ostream& stream_;
};

long long duty_cycle_ns(long long period_ns, double percent);

std::unique_ptr<SampleSink> make_output(const OutputSpec& spec);

}  // namespace fand

#endif  // FAND_OUTPUTS_HPP
