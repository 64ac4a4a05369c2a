#include "fand/stages.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

#include "fand/common.hpp"

namespace fand {

namespace {

// Flat JSON object writer for stage state snapshots.
class JsonObject {
public:
    JsonObject& number(const std::string& key, double value) {
        field(key);
        if (std::isfinite(value)) {
            out_ << format_number(value);
        } else {
            out_ << "null";
        }
        return *this;
    }

    JsonObject& integer(const std::string& key, long long value) {
        field(key);
        out_ << value;
        return *this;
    }

    JsonObject& optional_number(const std::string& key, const std::optional<double>& value) {
        if (value.has_value()) {
            return number(key, *value);
        }
        field(key);
        out_ << "null";
        return *this;
    }

    JsonObject& numbers(const std::string& key, const std::vector<double>& values) {
        field(key);
        out_ << "[";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out_ << ",";
            }
            out_ << (std::isfinite(values[i]) ? format_number(values[i]) : "null");
        }
        out_ << "]";
        return *this;
    }

    std::string str() const {
        return "{" + out_.str() + "}";
    }

private:
    void field(const std::string& key) {
        if (!first_) {
            out_ << ",";
        }
        first_ = false;
        out_ << "\"" << key << "\":";
    }

    std::ostringstream out_;
    bool first_ = true;
};

double rectify(double term) {
    return std::signbit(term) ? -term : 0.0;
}

}  // namespace

Stage::Stage(std::optional<MonitorHandle> monitor) : monitor_(std::move(monitor)) {}

std::optional<double> Stage::next(SampleSource& upstream) {
    if (exhausted_) {
        return std::nullopt;
    }
    auto value = produce(upstream);
    if (!value.has_value()) {
        exhausted_ = true;
        return std::nullopt;
    }
    if (monitor_.has_value()) {
        monitor_->publish(tag(), state());
        monitor_->publish_output(*value);
    }
    return value;
}

bool Stage::exhausted() const {
    return exhausted_;
}

bool Stage::monitored() const {
    return monitor_.has_value();
}

IdentityStage::IdentityStage(std::optional<MonitorHandle> monitor) : Stage(std::move(monitor)) {}

std::string IdentityStage::tag() const {
    return "Identity";
}

std::string IdentityStage::state() const {
    return "{}";
}

std::optional<double> IdentityStage::produce(SampleSource& upstream) {
    return upstream.next_sample();
}

AverageStage::AverageStage(const AverageSpec& spec, std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)), n_(static_cast<std::size_t>(std::max(spec.n, 1))) {
    window_.reserve(n_);
}

std::string AverageStage::tag() const {
    return "Average";
}

std::string AverageStage::state() const {
    return JsonObject()
        .integer("n", static_cast<long long>(n_))
        .integer("index", static_cast<long long>(index_))
        .numbers("prev_vals", window_)
        .str();
}

std::optional<double> AverageStage::produce(SampleSource& upstream) {
    auto value = upstream.next_sample();
    if (!value.has_value()) {
        return std::nullopt;
    }
    if (window_.size() < n_) {
        window_.push_back(*value);
    } else {
        window_[index_] = *value;
        index_ = (index_ + 1) % n_;
    }
    const double sum = std::accumulate(window_.begin(), window_.end(), 0.0);
    return sum / static_cast<double>(window_.size());
}

double rectified_pid_output(const ControlOutput& control, int offset) {
    const double sum = rectify(control.p) + rectify(control.i) + rectify(control.d);
    // Truncate toward zero, then cap; NaN contributes nothing.
    const double capped = std::isnan(sum) ? 0.0 : std::min(sum, 100.0);
    const auto truncated = static_cast<unsigned int>(capped);
    return static_cast<double>(static_cast<unsigned int>(offset) + truncated);
}

PidStage::PidStage(const PidSpec& spec, std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)), pid_(spec.gains), offset_(spec.offset) {
    if (offset_ < 0) {
        throw ConfigError("pid.offset must not be negative, got " + std::to_string(offset_));
    }
}

std::string PidStage::tag() const {
    return "PID";
}

std::string PidStage::state() const {
    return JsonObject()
        .number("P", last_control_.p)
        .number("I", last_control_.i)
        .number("D", last_control_.d)
        .number("integral", pid_.integral_term())
        .number("setpoint", pid_.gains().setpoint)
        .integer("offset", offset_)
        .number("output", last_output_)
        .str();
}

const ControlOutput& PidStage::last_control() const {
    return last_control_;
}

std::optional<double> PidStage::produce(SampleSource& upstream) {
    auto value = upstream.next_sample();
    if (!value.has_value()) {
        return std::nullopt;
    }
    last_control_ = pid_.next_control_output(*value);
    last_output_ = rectified_pid_output(last_control_, offset_);
    return last_output_;
}

DampenedOscillatorStage::DampenedOscillatorStage(const DampenedOscillatorSpec& spec,
                                                 std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)),
      m_(spec.m),
      k_(spec.k),
      dt_(spec.dt),
      c_(2.0 * std::sqrt(spec.k * spec.m)) {}

std::string DampenedOscillatorStage::tag() const {
    return "DampenedOscillator";
}

std::string DampenedOscillatorStage::state() const {
    return JsonObject()
        .number("m", m_)
        .number("k", k_)
        .number("dt", dt_)
        .number("target", target_)
        .number("c", c_)
        .number("pos", pos_)
        .number("vel", vel_)
        .number("acc", acc_)
        .str();
}

double DampenedOscillatorStage::damping() const {
    return c_;
}

double DampenedOscillatorStage::position() const {
    return pos_;
}

double DampenedOscillatorStage::velocity() const {
    return vel_;
}

std::optional<double> DampenedOscillatorStage::produce(SampleSource& upstream) {
    auto value = upstream.next_sample();
    if (!value.has_value()) {
        return std::nullopt;
    }
    target_ = *value;

    const double acc = -k_ * (pos_ - target_) - c_ * vel_;
    const double new_pos = pos_ + dt_ * vel_ + 0.5 * dt_ * dt_ * acc_;
    const double fac = dt_ / (2.0 * m_);
    const double new_vel = 1.0 / (1.0 + c_ * fac) * (vel_ * (1.0 - c_ * fac) + fac * (acc_ - acc));

    acc_ = acc;
    vel_ = new_vel;
    pos_ = new_pos;
    return new_pos;
}

ClipStage::ClipStage(const ClipSpec& spec, std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)), min_(to_fixed_point(spec.min)), max_(to_fixed_point(spec.max)) {}

std::string ClipStage::tag() const {
    return "Clip";
}

std::string ClipStage::state() const {
    return JsonObject().integer("max", max_).integer("min", min_).str();
}

std::optional<double> ClipStage::produce(SampleSource& upstream) {
    auto value = upstream.next_sample();
    if (!value.has_value()) {
        return std::nullopt;
    }
    std::int64_t scaled = to_fixed_point(*value);
    if (scaled > max_) {
        scaled = max_;
    }
    if (scaled < min_) {
        scaled = min_;
    }
    return from_fixed_point(scaled);
}

AtLeastStage::AtLeastStage(const AtLeastSpec& spec, std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)), threshold_(to_fixed_point(spec.threshold)) {}

std::string AtLeastStage::tag() const {
    return "AtLeast";
}

std::string AtLeastStage::state() const {
    return JsonObject().integer("threshold", threshold_).str();
}

std::optional<double> AtLeastStage::produce(SampleSource& upstream) {
    auto value = upstream.next_sample();
    if (!value.has_value()) {
        return std::nullopt;
    }
    if (to_fixed_point(*value) < threshold_) {
        return 0.0;
    }
    return value;
}

SupersampleStage::SupersampleStage(const SupersampleSpec& spec, std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)), n_(static_cast<std::size_t>(std::max(spec.n, 1))) {}

std::string SupersampleStage::tag() const {
    return "Supersample";
}

std::string SupersampleStage::state() const {
    return JsonObject()
        .integer("n", static_cast<long long>(n_))
        .integer("count", static_cast<long long>(count_))
        .optional_number("last_val", last_value_)
        .str();
}

std::optional<double> SupersampleStage::produce(SampleSource& upstream) {
    if (last_value_.has_value() && count_ < n_) {
        ++count_;
        return last_value_;
    }
    auto value = upstream.next_sample();
    if (!value.has_value()) {
        return std::nullopt;
    }
    last_value_ = value;
    count_ = 1;
    return value;
}

SubsampleStage::SubsampleStage(const SubsampleSpec& spec, std::optional<MonitorHandle> monitor)
    : Stage(std::move(monitor)), n_(static_cast<std::size_t>(std::max(spec.n, 0))) {}

std::string SubsampleStage::tag() const {
    return "Subsample";
}

std::string SubsampleStage::state() const {
    return JsonObject().integer("n", static_cast<long long>(n_)).str();
}

std::optional<double> SubsampleStage::produce(SampleSource& upstream) {
    for (std::size_t i = 0; i < n_; ++i) {
        if (!upstream.next_sample().has_value()) {
            return std::nullopt;
        }
    }
    return upstream.next_sample();
}

}  // namespace fand
