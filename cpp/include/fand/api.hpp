#ifndef FAND_API_HPP
#define FAND_API_HPP

#include <memory>

#include "fand/config.hpp"
#include "fand/inputs.hpp"
#include "fand/logging.hpp"
#include "fand/monitor.hpp"
#include "fand/outputs.hpp"
#include "fand/pipeline.hpp"
#include "fand/registry.hpp"
#include "fand/scheduler.hpp"

namespace fand {

// Everything one control loop needs. Members are declared so that the
// scheduler is destroyed before the pipeline and sink it refers to.
struct FandRuntime {
    std::shared_ptr<MessageChannel> channel;
    std::shared_ptr<SubscriberSet> subscribers;
    std::unique_ptr<Pipeline> pipeline;
    std::unique_ptr<SampleSink> sink;
    std::unique_ptr<Scheduler> scheduler;
    std::unique_ptr<MonitorHub> hub;
    std::unique_ptr<SubscriberAcceptor> acceptor;

    bool monitored() const { return channel != nullptr; }
};

// Builds the runtime described by `settings`. `source` and `sink` override
// the configured input and output when given. Monitoring parts are only
// created when settings.monitor.enabled is set; nothing is started here.
FandRuntime build_runtime(const FandSettings& settings, std::unique_ptr<SampleSource> source = nullptr,
                          std::unique_ptr<SampleSink> sink = nullptr, Logger logger = get_logger("fand"));

}  // namespace fand

#endif  // FAND_API_HPP
