#include "fand/api.hpp"

namespace fand {

FandRuntime build_runtime(const FandSettings& settings, std::unique_ptr<SampleSource> source,
                          std::unique_ptr<SampleSink> sink, Logger logger) {
    configure_logging(settings.logging);

    const auto& spec = settings.pipeline;
    FandRuntime runtime;
    if (settings.monitor.enabled) {
        runtime.channel = std::make_shared<MessageChannel>();
        runtime.subscribers = std::make_shared<SubscriberSet>();
    }

    if (!source) {
        source = make_input(spec.input);
    }
    runtime.pipeline = assemble_pipeline(spec.stages, std::move(source), runtime.channel);
    runtime.sink = sink ? std::move(sink) : make_output(spec.output);
    runtime.scheduler = std::make_unique<Scheduler>(*runtime.pipeline, *runtime.sink,
                                                    std::chrono::milliseconds(spec.sample_period_ms));

    if (runtime.monitored()) {
        runtime.hub = std::make_unique<MonitorHub>(runtime.channel, runtime.subscribers);
        runtime.acceptor = std::make_unique<SubscriberAcceptor>(settings.monitor.socket_path, runtime.subscribers);
    }

    logger.info("runtime_built", {{"stages", std::to_string(runtime.pipeline->size())},
                                  {"period_ms", std::to_string(spec.sample_period_ms)},
                                  {"monitored", runtime.monitored() ? "true" : "false"}});
    return runtime;
}

}  // namespace fand
