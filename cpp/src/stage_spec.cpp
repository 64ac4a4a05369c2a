#include "fand/stage_spec.hpp"

#include <cmath>

namespace fand {

namespace {

struct KindName {
    std::string operator()(const IdentitySpec&) const { return "identity"; }
    std::string operator()(const AverageSpec&) const { return "average"; }
    std::string operator()(const PidSpec&) const { return "pid"; }
    std::string operator()(const DampenedOscillatorSpec&) const { return "dampened_oscillator"; }
    std::string operator()(const ClipSpec&) const { return "clip"; }
    std::string operator()(const AtLeastSpec&) const { return "at_least"; }
    std::string operator()(const SupersampleSpec&) const { return "supersample"; }
    std::string operator()(const SubsampleSpec&) const { return "subsample"; }
};

struct TagName {
    std::string operator()(const IdentitySpec&) const { return "Identity"; }
    std::string operator()(const AverageSpec&) const { return "Average"; }
    std::string operator()(const PidSpec&) const { return "PID"; }
    std::string operator()(const DampenedOscillatorSpec&) const { return "DampenedOscillator"; }
    std::string operator()(const ClipSpec&) const { return "Clip"; }
    std::string operator()(const AtLeastSpec&) const { return "AtLeast"; }
    std::string operator()(const SupersampleSpec&) const { return "Supersample"; }
    std::string operator()(const SubsampleSpec&) const { return "Subsample"; }
};

void require_finite(double value, const std::string& stage, const std::string& field) {
    if (!std::isfinite(value)) {
        throw ConfigError(stage + "." + field + " must be a finite number");
    }
}

struct Validator {
    void operator()(const IdentitySpec&) const {}

    void operator()(const AverageSpec& spec) const {
        if (spec.n < 1) {
            throw ConfigError("average.n must be at least 1, got " + std::to_string(spec.n));
        }
    }

    void operator()(const PidSpec& spec) const {
        const auto& gains = spec.gains;
        require_finite(gains.kp, "pid", "kp");
        require_finite(gains.ki, "pid", "ki");
        require_finite(gains.kd, "pid", "kd");
        require_finite(gains.p_limit, "pid", "p_limit");
        require_finite(gains.i_limit, "pid", "i_limit");
        require_finite(gains.d_limit, "pid", "d_limit");
        require_finite(gains.setpoint, "pid", "setpoint");
        if (spec.offset < 0) {
            throw ConfigError("pid.offset must not be negative, got " + std::to_string(spec.offset));
        }
    }

    void operator()(const DampenedOscillatorSpec& spec) const {
        require_finite(spec.m, "dampened_oscillator", "m");
        require_finite(spec.k, "dampened_oscillator", "k");
        require_finite(spec.dt, "dampened_oscillator", "dt");
        if (spec.m <= 0.0) {
            throw ConfigError("dampened_oscillator.m must be positive");
        }
        if (spec.k < 0.0) {
            throw ConfigError("dampened_oscillator.k must not be negative");
        }
        if (spec.dt <= 0.0) {
            throw ConfigError("dampened_oscillator.dt must be positive");
        }
    }

    void operator()(const ClipSpec& spec) const {
        require_finite(spec.min, "clip", "min");
        require_finite(spec.max, "clip", "max");
        if (spec.min > spec.max) {
            throw ConfigError("clip.min must not exceed clip.max");
        }
    }

    void operator()(const AtLeastSpec& spec) const {
        require_finite(spec.threshold, "at_least", "threshold");
    }

    void operator()(const SupersampleSpec& spec) const {
        if (spec.n < 1) {
            throw ConfigError("supersample.n must be at least 1, got " + std::to_string(spec.n));
        }
    }

    void operator()(const SubsampleSpec& spec) const {
        if (spec.n < 0) {
            throw ConfigError("subsample.n must not be negative, got " + std::to_string(spec.n));
        }
    }
};

}  // namespace

std::string stage_kind(const StageSpec& spec) {
    return std::visit(KindName{}, spec);
}

std::string stage_tag(const StageSpec& spec) {
    return std::visit(TagName{}, spec);
}

void validate_stage_spec(const StageSpec& spec) {
    std::visit(Validator{}, spec);
}

std::vector<StageSpec> default_stage_specs() {
    PidSpec pid;
    pid.gains = PidGains{2.0, 2.0, 5.0, 100.0, 10.0, 30.0, 35.0};
    pid.offset = 30;

    return {
        AverageSpec{5},
        pid,
        ClipSpec{30.0, 100.0},
        SupersampleSpec{100},
        DampenedOscillatorSpec{0.5, 2.0, 0.25},
        DampenedOscillatorSpec{1.0, 1.0, 0.25},
        ClipSpec{30.0, 100.0},
        SubsampleSpec{4},
    };
}

}  // namespace fand
