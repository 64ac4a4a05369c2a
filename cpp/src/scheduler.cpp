#include "fand/scheduler.hpp"

#include <cmath>
#include <stdexcept>
#include <thread>

#include "fand/common.hpp"

namespace fand {

namespace {

double round_to_hundredths(double value) {
    return std::round(value * 100.0);
}

}  // namespace

bool OutputSuppressor::should_forward(double value) {
    if (last_forwarded_.has_value() &&
        round_to_hundredths(value) == round_to_hundredths(last_forwarded_.value())) {
        return false;
    }
    last_forwarded_ = value;
    return true;
}

std::optional<double> OutputSuppressor::last_forwarded() const {
    return last_forwarded_;
}

Scheduler::Scheduler(SampleSource& chain, SampleSink& sink, std::chrono::milliseconds period, Logger logger)
    : chain_(chain), sink_(sink), period_(period), logger_(std::move(logger)) {}

SchedulerState Scheduler::tick() {
    if (state_ == SchedulerState::kStopped) {
        return SchedulerState::kStopped;
    }
    ++ticks_;
    auto value = chain_.next_sample();
    if (!value.has_value()) {
        logger_.info("pipeline_exhausted", {{"ticks", std::to_string(ticks_)}});
        state_ = SchedulerState::kStopped;
        return state_;
    }
    if (!suppressor_.should_forward(*value)) {
        logger_.debug("output_suppressed", {{"value", format_number(*value)}});
        return state_;
    }
    try {
        sink_.push(*value);
    } catch (const std::exception& exc) {
        logger_.error("sink_push_failed", {{"value", format_number(*value)}, {"error", exc.what()}});
        state_ = SchedulerState::kStopped;
        throw;
    }
    ++forwarded_;
    logger_.debug("output_forwarded", {{"value", format_number(*value)}});
    return state_;
}

void Scheduler::run() {
    logger_.info("scheduler_started", {{"period_ms", std::to_string(period_.count())}});
    while (!stop_requested_ && tick() == SchedulerState::kRunning) {
        std::this_thread::sleep_for(period_);
    }
    state_ = SchedulerState::kStopped;
    logger_.info("scheduler_stopped",
                 {{"ticks", std::to_string(ticks_)}, {"forwarded", std::to_string(forwarded_)}});
}

void Scheduler::stop() {
    stop_requested_ = true;
}

SchedulerState Scheduler::state() const {
    return state_;
}

std::size_t Scheduler::ticks() const {
    return ticks_;
}

std::size_t Scheduler::forwarded() const {
    return forwarded_;
}

}  // namespace fand
