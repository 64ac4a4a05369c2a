#include "fand/config.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

#include "fand/common.hpp"

namespace fand {

namespace {

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw ConfigError("invalid boolean for " + key + ": " + value);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError("invalid number for " + key + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError("invalid integer for " + key + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("invalid integer for " + key + ": " + value);
    }
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

std::vector<double> parse_number_array(const std::string& key, const std::string& value) {
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        throw ConfigError("expected an array for " + key + ": " + value);
    }
    std::vector<double> numbers;
    const auto body = trim(value.substr(1, value.size() - 2));
    if (body.empty()) {
        return numbers;
    }
    for (const auto& part : split(body, ',')) {
        const auto item = trim(part);
        if (item.empty()) {
            continue;
        }
        numbers.push_back(parse_double(key, item));
    }
    return numbers;
}

// Drops a trailing comment, leaving '#' inside quoted strings alone.
std::string strip_comment(const std::string& line) {
    char quote = '\0';
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

InputKind parse_input_kind(const std::string& value) {
    if (value == "file" || value == "thermal_zone") {
        return InputKind::kFile;
    }
    if (value == "command") {
        return InputKind::kCommand;
    }
    if (value == "replay") {
        return InputKind::kReplay;
    }
    throw ConfigError("unknown input kind: " + value);
}

OutputKind parse_output_kind(const std::string& value) {
    if (value == "pwm") {
        return OutputKind::kPwm;
    }
    if (value == "command") {
        return OutputKind::kCommand;
    }
    if (value == "stdout") {
        return OutputKind::kStdout;
    }
    throw ConfigError("unknown output kind: " + value);
}

class FieldReader {
public:
    FieldReader(const std::map<std::string, std::string>& fields, std::string kind)
        : fields_(fields), kind_(std::move(kind)) {
        used_.insert("kind");
    }

    double required_double(const std::string& key) {
        return parse_double(qualified(key), require(key));
    }

    double optional_double(const std::string& key, double fallback) {
        auto it = lookup(key);
        return it == fields_.end() ? fallback : parse_double(qualified(key), it->second);
    }

    int required_int(const std::string& key) {
        return parse_int(qualified(key), require(key));
    }

    int optional_int(const std::string& key, int fallback) {
        auto it = lookup(key);
        return it == fields_.end() ? fallback : parse_int(qualified(key), it->second);
    }

    std::optional<double> maybe_double(const std::string& key) {
        auto it = lookup(key);
        if (it == fields_.end()) {
            return std::nullopt;
        }
        return parse_double(qualified(key), it->second);
    }

    void finish() const {
        for (const auto& [key, value] : fields_) {
            if (used_.count(key) == 0) {
                throw ConfigError("unknown key for " + kind_ + " stage: " + key);
            }
        }
    }

private:
    std::map<std::string, std::string>::const_iterator lookup(const std::string& key) {
        used_.insert(key);
        return fields_.find(key);
    }

    const std::string& require(const std::string& key) {
        auto it = lookup(key);
        if (it == fields_.end()) {
            throw ConfigError(kind_ + " stage requires key: " + key);
        }
        return it->second;
    }

    std::string qualified(const std::string& key) const {
        return kind_ + "." + key;
    }

    const std::map<std::string, std::string>& fields_;
    std::string kind_;
    std::set<std::string> used_;
};

}  // namespace

StageSpec stage_spec_from_fields(const std::map<std::string, std::string>& fields) {
    auto kind_it = fields.find("kind");
    if (kind_it == fields.end()) {
        throw ConfigError("stage is missing its kind");
    }
    const std::string kind = strip_quotes(kind_it->second);
    FieldReader reader(fields, kind);

    StageSpec spec;
    if (kind == "identity") {
        spec = IdentitySpec{};
    } else if (kind == "average") {
        spec = AverageSpec{reader.required_int("n")};
    } else if (kind == "pid") {
        PidSpec pid;
        pid.gains.kp = reader.required_double("kp");
        pid.gains.ki = reader.required_double("ki");
        pid.gains.kd = reader.required_double("kd");
        pid.gains.p_limit = reader.optional_double("p_limit", pid.gains.p_limit);
        pid.gains.i_limit = reader.optional_double("i_limit", pid.gains.i_limit);
        pid.gains.d_limit = reader.optional_double("d_limit", pid.gains.d_limit);
        pid.gains.setpoint = reader.optional_double("setpoint", pid.gains.setpoint);
        pid.offset = reader.optional_int("offset", 0);
        spec = pid;
    } else if (kind == "dampened_oscillator") {
        DampenedOscillatorSpec oscillator;
        oscillator.m = reader.required_double("m");
        oscillator.k = reader.required_double("k");
        oscillator.dt = reader.required_double("dt");
        oscillator.damping = reader.maybe_double("damping");
        spec = oscillator;
    } else if (kind == "clip") {
        spec = ClipSpec{reader.required_double("min"), reader.required_double("max")};
    } else if (kind == "at_least") {
        spec = AtLeastSpec{reader.required_double("threshold")};
    } else if (kind == "supersample") {
        spec = SupersampleSpec{reader.required_int("n")};
    } else if (kind == "subsample") {
        spec = SubsampleSpec{reader.required_int("n")};
    } else {
        throw ConfigError("unknown stage kind: " + kind);
    }
    reader.finish();
    validate_stage_spec(spec);
    return spec;
}

FandSettings FandSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("unable to open config file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_toml(contents.str());
}

FandSettings FandSettings::parse_toml(const std::string& text) {
    FandSettings settings;
    std::vector<StageSpec> stages;
    bool saw_stage = false;
    std::optional<std::map<std::string, std::string>> pending_stage;

    auto flush_stage = [&]() {
        if (pending_stage.has_value()) {
            stages.push_back(stage_spec_from_fields(*pending_stage));
            pending_stage.reset();
        }
    };

    std::istringstream input(text);
    std::string current_section;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        line = trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }
        if (line.rfind("[[", 0) == 0 && line.size() >= 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
            flush_stage();
            current_section = trim(line.substr(2, line.size() - 4));
            if (current_section != "stage") {
                throw ConfigError("unknown table array at line " + std::to_string(line_number) + ": " +
                                  current_section);
            }
            pending_stage.emplace();
            saw_stage = true;
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            flush_stage();
            current_section = trim(line.substr(1, line.size() - 2));
            if (current_section == "stage") {
                throw ConfigError("stage tables must be written [[stage]] at line " +
                                  std::to_string(line_number));
            }
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigError("expected key = value at line " + std::to_string(line_number));
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "stage") {
            if (!pending_stage.has_value()) {
                throw ConfigError("key outside a [[stage]] table at line " + std::to_string(line_number));
            }
            (*pending_stage)[key] = strip_quotes(value);
        } else if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(key, value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "monitor") {
            if (key == "enabled") {
                settings.monitor.enabled = parse_bool(key, value);
            } else if (key == "socket_path") {
                settings.monitor.socket_path = strip_quotes(value);
            }
        } else if (current_section == "input") {
            if (key == "kind") {
                settings.pipeline.input.kind = parse_input_kind(strip_quotes(value));
            } else if (key == "path") {
                settings.pipeline.input.path = strip_quotes(value);
            } else if (key == "command") {
                settings.pipeline.input.command = strip_quotes(value);
            } else if (key == "scale") {
                settings.pipeline.input.scale = parse_double(key, value);
            } else if (key == "values") {
                settings.pipeline.input.values = parse_number_array(key, value);
            }
        } else if (current_section == "output") {
            if (key == "kind") {
                settings.pipeline.output.kind = parse_output_kind(strip_quotes(value));
            } else if (key == "chip") {
                settings.pipeline.output.chip = strip_quotes(value);
            } else if (key == "channel") {
                settings.pipeline.output.channel = parse_int(key, value);
            } else if (key == "frequency_hz") {
                settings.pipeline.output.frequency_hz = parse_double(key, value);
            } else if (key == "command") {
                settings.pipeline.output.command = strip_quotes(value);
            }
        } else if (current_section.empty()) {
            if (key == "sample_period_ms") {
                settings.pipeline.sample_period_ms = parse_int(key, value);
            }
        }
    }
    flush_stage();

    if (saw_stage) {
        settings.pipeline.stages = std::move(stages);
    }
    if (settings.pipeline.sample_period_ms < 0) {
        throw ConfigError("sample_period_ms must not be negative");
    }
    if (settings.pipeline.input.kind == InputKind::kCommand && settings.pipeline.input.command.empty()) {
        throw ConfigError("command input requires input.command");
    }
    if (settings.pipeline.output.kind == OutputKind::kCommand && settings.pipeline.output.command.empty()) {
        throw ConfigError("command output requires output.command");
    }
    if (settings.pipeline.output.kind == OutputKind::kPwm && settings.pipeline.output.frequency_hz <= 0.0) {
        throw ConfigError("output.frequency_hz must be positive");
    }
    return settings;
}

}  // namespace fand
