#include "fand/outputs.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "fand/common.hpp"

namespace fand {

namespace {

void write_attribute(const std::string& path, const std::string& value) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open " + path);
    }
    file << value;
    file.flush();
    if (!file) {
        throw std::runtime_error("unable to write " + value + " to " + path);
    }
}

}  // namespace

long long duty_cycle_ns(long long period_ns, double percent) {
    if (std::isnan(percent)) {
        percent = 0.0;
    }
    const double fraction = std::clamp(percent / 100.0, 0.0, 1.0);
    return static_cast<long long>(std::llround(static_cast<double>(period_ns) * fraction));
}

SysfsPwmOutput::SysfsPwmOutput(std::string chip, int channel, double frequency_hz, Logger logger)
    : chip_(std::move(chip)), channel_(channel), logger_(std::move(logger)) {
    if (frequency_hz <= 0.0) {
        throw std::runtime_error("pwm frequency must be positive");
    }
    period_ns_ = static_cast<long long>(std::llround(1e9 / frequency_hz));

    const std::filesystem::path channel_dir = std::filesystem::path(chip_) / ("pwm" + std::to_string(channel_));
    std::error_code ec;
    if (!std::filesystem::exists(channel_dir, ec)) {
        write_attribute(chip_ + "/export", std::to_string(channel_));
        // udev may need a moment to hand over the new attributes.
        for (int attempt = 0; attempt < 20 && !std::filesystem::exists(channel_dir / "period", ec); ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    write_attribute(attribute("period"), std::to_string(period_ns_));
    write_attribute(attribute("duty_cycle"), std::to_string(duty_cycle_ns(period_ns_, 50.0)));
    write_attribute(attribute("polarity"), "normal");
    write_attribute(attribute("enable"), "1");
    logger_.info("pwm_enabled", {{"chip", chip_},
                                 {"channel", std::to_string(channel_)},
                                 {"period_ns", std::to_string(period_ns_)}});
}

SysfsPwmOutput::~SysfsPwmOutput() {
    std::ofstream file(attribute("enable"));
    if (file) {
        file << "0";
    }
}

void SysfsPwmOutput::push(double value) {
    const long long duty = duty_cycle_ns(period_ns_, value);
    logger_.debug("pwm_duty_cycle", {{"percent", format_number(value)}, {"duty_ns", std::to_string(duty)}});
    write_attribute(attribute("duty_cycle"), std::to_string(duty));
}

long long SysfsPwmOutput::period_ns() const {
    return period_ns_;
}

std::string SysfsPwmOutput::attribute(const std::string& name) const {
    return chip_ + "/pwm" + std::to_string(channel_) + "/" + name;
}

CommandOutput::CommandOutput(std::string command, Logger logger)
    : command_(std::move(command)), logger_(std::move(logger)) {
    if (command_.empty()) {
        throw std::runtime_error("command output requires a command");
    }
}

void CommandOutput::push(double value) {
    const std::string invocation = command_ + " " + format_number(value);
    const int status = std::system(invocation.c_str());
    if (status != 0) {
        throw std::runtime_error("output command failed with status " + std::to_string(status) + ": " +
                                 invocation);
    }
    logger_.debug("output_command_ran", {{"command", invocation}});
}

StdoutOutput::StdoutOutput(std::ostream& stream) : stream_(stream) {}

StdoutOutput::StdoutOutput() : stream_(std::cout) {}

void StdoutOutput::push(double value) {
    stream_ << format_number(value) << '\n';
    stream_.flush();
    if (!stream_) {
        throw std::runtime_error("unable to write to output stream");
    }
}

std::unique_ptr<SampleSink> make_output(const OutputSpec& spec) {
    switch (spec.kind) {
        case OutputKind::kPwm:
            return std::make_unique<SysfsPwmOutput>(spec.chip, spec.channel, spec.frequency_hz);
        case OutputKind::kCommand:
            return std::make_unique<CommandOutput>(spec.command);
        case OutputKind::kStdout:
            return std::make_unique<StdoutOutput>();
    }
    throw ConfigError("unsupported output kind");
}

}  // namespace fand
