#include "fand/inputs.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "fand/common.hpp"

namespace fand {

std::optional<double> parse_sample(const std::string& text, double scale) {
    std::istringstream stream(trim(text));
    double value = 0.0;
    if (!(stream >> value)) {
        return std::nullopt;
    }
    return value * scale;
}

FileInput::FileInput(std::string path, double scale, Logger logger)
    : path_(std::move(path)), scale_(scale), logger_(std::move(logger)) {}

std::optional<double> FileInput::next_sample() {
    std::ifstream file(path_);
    if (!file) {
        logger_.error("input_unreadable", {{"path", path_}});
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    auto value = parse_sample(contents.str(), scale_);
    if (!value.has_value()) {
        logger_.error("input_unparsable", {{"path", path_}});
        return std::nullopt;
    }
    logger_.debug("input_sample", {{"value", format_number(*value)}});
    return value;
}

CommandInput::CommandInput(std::string command, double scale, Logger logger)
    : command_(std::move(command)), scale_(scale), logger_(std::move(logger)) {}

std::optional<double> CommandInput::next_sample() {
    FILE* pipe = ::popen(command_.c_str(), "r");
    if (pipe == nullptr) {
        logger_.error("input_command_failed", {{"command", command_}});
        return std::nullopt;
    }
    std::string output;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    const int status = ::pclose(pipe);
    if (status != 0) {
        logger_.error("input_command_failed", {{"command", command_}, {"status", std::to_string(status)}});
        return std::nullopt;
    }
    auto value = parse_sample(output, scale_);
    if (!value.has_value()) {
        logger_.error("input_unparsable", {{"command", command_}});
        return std::nullopt;
    }
    logger_.debug("input_sample", {{"value", format_number(*value)}});
    return value;
}

ReplayInput::ReplayInput(std::vector<double> values) : values_(std::move(values)) {}

std::optional<double> ReplayInput::next_sample() {
    if (position_ >= values_.size()) {
        return std::nullopt;
    }
    return values_[position_++];
}

std::size_t ReplayInput::remaining() const {
    return values_.size() - position_;
}

std::unique_ptr<SampleSource> make_input(const InputSpec& spec) {
    switch (spec.kind) {
        case InputKind::kFile:
            return std::make_unique<FileInput>(spec.path, spec.scale);
        case InputKind::kCommand:
            return std::make_unique<CommandInput>(spec.command, spec.scale);
        case InputKind::kReplay:
            return std::make_unique<ReplayInput>(spec.values);
    }
    throw ConfigError("unsupported input kind");
}

}  // namespace fand
