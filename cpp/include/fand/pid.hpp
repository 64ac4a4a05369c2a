#ifndef FAND_PID_HPP
#define FAND_PID_HPP

#include <optional>

#include "fand/stage_spec.hpp"

namespace fand {

struct ControlOutput {
    double p = 0.0;
    double i = 0.0;
    double d = 0.0;
    double output = 0.0;
};

// Limited PID controller. The proportional and derivative terms and the
// integral accumulator are each clamped to [-|limit|, |limit|]. The
// derivative acts on the measurement, not the error.
class PidController {
public:
    explicit PidController(PidGains gains);

    ControlOutput next_control_output(double measurement);
    void reset();

    const PidGains& gains() const;
    double integral_term() const;
    std::optional<double> prev_measurement() const;

private:
    PidGains gains_{};
    double integral_term_ = 0.0;
    std::optional<double> prev_measurement_;
};

}  // namespace fand

#endif  // FAND_PID_HPP
