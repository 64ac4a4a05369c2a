#include "fand/pid.hpp"

#include <algorithm>
#include <cmath>

namespace fand {

namespace {

double apply_limit(double limit, double value) {
    const double bound = std::abs(limit);
    return std::clamp(value, -bound, bound);
}

}  // namespace

PidController::PidController(PidGains gains) : gains_(gains) {}

ControlOutput PidController::next_control_output(double measurement) {
    const double error = gains_.setpoint - measurement;

    const double p = apply_limit(gains_.p_limit, error * gains_.kp);

    integral_term_ = apply_limit(gains_.i_limit, integral_term_ + error * gains_.ki);

    const double delta = prev_measurement_.has_value() ? measurement - prev_measurement_.value() : 0.0;
    prev_measurement_ = measurement;
    const double d = apply_limit(gains_.d_limit, -delta * gains_.kd);

    return ControlOutput{p, integral_term_, d, p + integral_term_ + d};
}

void PidController::reset() {
    integral_term_ = 0.0;
    prev_measurement_ = std::nullopt;
}

const PidGains& PidController::gains() const {
    return gains_;
}

double PidController::integral_term() const {
    return integral_term_;
}

std::optional<double> PidController::prev_measurement() const {
    return prev_measurement_;
}

}  // namespace fand
