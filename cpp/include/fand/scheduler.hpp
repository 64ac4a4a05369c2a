#ifndef FAND_SCHEDULER_HPP
#define FAND_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>

#include "fand/inputs.hpp"
#include "fand/logging.hpp"
#include "fand/outputs.hpp"

namespace fand {

// Forwards a value only when its two-decimal rounding differs from that of
// the last forwarded value. The first value always goes through.
class OutputSuppressor {
public:
    bool should_forward(double value);

    std::optional<double> last_forwarded() const;

private:
    std::optional<double> last_forwarded_;
};

enum class SchedulerState {
    kRunning,
    kStopped,
};

class Scheduler {
public:
    Scheduler(SampleSource& chain, SampleSink& sink, std::chrono::milliseconds period,
              Logger logger = get_logger("Scheduler"));

    // One evaluation of the chain. Sink errors stop the scheduler and
    // propagate.
    SchedulerState tick();

    // Ticks until the chain is exhausted or stop() is called, sleeping one
    // period between ticks. Missed ticks are not caught up.
    void run();
    void stop();

    SchedulerState state() const;
    std::size_t ticks() const;
    std::size_t forwarded() const;

private:
    SampleSource& chain_;
    SampleSink& sink_;
    std::chrono::milliseconds period_;
    Logger logger_;
    OutputSuppressor suppressor_;
    std::atomic<SchedulerState> state_{SchedulerState::kRunning};
    std::atomic<bool> stop_requested_{false};
    std::size_t ticks_ = 0;
    std::size_t forwarded_ = 0;
};

}  // namespace fand

#endif  // FAND_SCHEDULER_HPP
