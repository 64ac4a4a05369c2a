#ifndef FAND_STAGE_SPEC_HPP
#define FAND_STAGE_SPEC_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace fand {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PidGains {
    double kp = 0.0;
    double ki = 0.0;
    double kd = 0.0;
    double p_limit = 100.0;
    double i_limit = 100.0;
    double d_limit = 100.0;
    double setpoint = 0.0;
};

struct IdentitySpec {};

struct AverageSpec {
    int n = 1;
};

struct PidSpec {
    PidGains gains{};
    int offset = 0;
};

// `damping` is accepted for compatibility with older configurations and
// ignored: the stage always runs critically damped.
struct DampenedOscillatorSpec {
    double m = 1.0;
    double k = 1.0;
    double dt = 0.25;
    std::optional<double> damping = std::nullopt;
};

struct ClipSpec {
    double min = 0.0;
    double max = 100.0;
};

struct AtLeastSpec {
    double threshold = 0.0;
};

struct SupersampleSpec {
    int n = 1;
};

struct SubsampleSpec {
    int n = 0;
};

using StageSpec = std::variant<IdentitySpec, AverageSpec, PidSpec, DampenedOscillatorSpec, ClipSpec,
                               AtLeastSpec, SupersampleSpec, SubsampleSpec>;

std::string stage_kind(const StageSpec& spec);
std::string stage_tag(const StageSpec& spec);

void validate_stage_spec(const StageSpec& spec);

std::vector<StageSpec> default_stage_specs();

}  // namespace fand

#endif  // FAND_STAGE_SPEC_HPP
