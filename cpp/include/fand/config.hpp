#ifndef FAND_CONFIG_HPP
#define FAND_CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "fand/stage_spec.hpp"

namespace fand {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = false;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct MonitorConfig {
    bool enabled = false;
    std::string socket_path = "/tmp/fand.sock";
};

enum class InputKind {
    kFile,
    kCommand,
    kReplay,
};

struct InputSpec {
    InputKind kind = InputKind::kFile;
    std::string path = "/sys/class/thermal/thermal_zone0/temp";
    std::string command;
    double scale = 0.001;
    std::vector<double> values;
};

enum class OutputKind {
    kPwm,
    kCommand,
    kStdout,
};

struct OutputSpec {
    OutputKind kind = OutputKind::kPwm;
    std::string chip = "/sys/class/pwm/pwmchip0";
    int channel = 0;
    double frequency_hz = 20000.0;
    std::string command;
};

// The pipeline description: input selector, ordered stages, output
// selector and the tick period. Immutable once loaded.
struct PipelineSpec {
    InputSpec input{};
    std::vector<StageSpec> stages = default_stage_specs();
    OutputSpec output{};
    int sample_period_ms = 1000;
};

struct FandSettings {
    LoggingConfig logging{};
    MonitorConfig monitor{};
    PipelineSpec pipeline{};

    static FandSettings from_toml(const std::string& path);
    static FandSettings parse_toml(const std::string& text);
};

StageSpec stage_spec_from_fields(const std::map<std::string, std::string>& fields);

}  // namespace fand

#endif  // FAND_CONFIG_HPP
