#ifndef FAND_STAGES_HPP
#define FAND_STAGES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fand/inputs.hpp"
#include "fand/monitor.hpp"
#include "fand/pid.hpp"
#include "fand/stage_spec.hpp"

namespace fand {

// One stream transform. A stage pulls from its upstream on demand and may
// consume zero, one or several upstream values per produced output. Once
// it has produced nothing it stays exhausted and never pulls again.
//
// With a monitor handle attached, every produced value is followed by two
// messages: the stage's state and the value itself under the ">" tag.
class Stage {
public:
    explicit Stage(std::optional<MonitorHandle> monitor = std::nullopt);
    virtual ~Stage() = default;

    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    std::optional<double> next(SampleSource& upstream);

    virtual std::string tag() const = 0;
    virtual std::string state() const = 0;

    bool exhausted() const;
    bool monitored() const;

protected:
    virtual std::optional<double> produce(SampleSource& upstream) = 0;

private:
    std::optional<MonitorHandle> monitor_;
    bool exhausted_ = false;
};

class IdentityStage : public Stage {
public:
    explicit IdentityStage(std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

protected:
    std::optional<double> produce(SampleSource& upstream) override;
};

// Moving mean over a ring buffer of the last `n` values. The mean is
// recomputed from the whole window on each tick.
class AverageStage : public Stage {
public:
    AverageStage(const AverageSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    std::size_t n_ = 1;
    std::size_t index_ = 0;
    std::vector<double> window_;
};

// PID whose terms are rectified: a negative term contributes its magnitude,
// a non-negative term contributes nothing. The summed magnitudes are
// truncated, capped at 100 and shifted by `offset`.
class PidStage : public Stage {
public:
    PidStage(const PidSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

    const ControlOutput& last_control() const;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    PidController pid_;
    int offset_ = 0;
    ControlOutput last_control_{};
    double last_output_ = 0.0;
};

// Point mass on a spring chasing the upstream value as its moving target.
// The damping coefficient is always the critical one, 2*sqrt(k*m).
class DampenedOscillatorStage : public Stage {
public:
    static constexpr double kInitialPosition = 100.0;

    DampenedOscillatorStage(const DampenedOscillatorSpec& spec,
                            std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

    double damping() const;
    double position() const;
    double velocity() const;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    double m_ = 1.0;
    double k_ = 1.0;
    double dt_ = 0.25;
    double c_ = 0.0;
    double target_ = kInitialPosition;
    double pos_ = kInitialPosition;
    double vel_ = 0.0;
    double acc_ = 0.0;
};

// Comparisons run on thousandths (value * 1000, truncated) rather than on
// the raw doubles.
class ClipStage : public Stage {
public:
    ClipStage(const ClipSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    std::int64_t min_ = 0;
    std::int64_t max_ = 0;
};

class AtLeastStage : public Stage {
public:
    AtLeastStage(const AtLeastSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    std::int64_t threshold_ = 0;
};

// Emits each upstream value `n` times before pulling the next one.
class SupersampleStage : public Stage {
public:
    SupersampleStage(const SupersampleSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    std::size_t n_ = 1;
    std::size_t count_ = 1;
    std::optional<double> last_value_;
};

// Discards `n` upstream values and emits the one after them.
class SubsampleStage : public Stage {
public:
    SubsampleStage(const SubsampleSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

    std::string tag() const override;
    std::string state() const override;

protected:
    std::optional<double> produce(SampleSource& upstream) override;

private:
    std::size_t n_ = 0;
};

double rectified_pid_output(const ControlOutput& control, int offset);

}  // namespace fand

#endif  // FAND_STAGES_HPP
