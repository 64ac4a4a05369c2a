#include "fand/daemon.hpp"

namespace fand {

FanDaemon::FanDaemon(FandRuntime runtime) : runtime_(std::move(runtime)), logger_(get_logger("FanDaemon")) {}

void FanDaemon::run() {
    logger_.info("daemon_started", {{"monitored", runtime_.monitored() ? "true" : "false"}});
    try {
        if (runtime_.hub) {
            runtime_.hub->start();
        }
        if (runtime_.acceptor) {
            runtime_.acceptor->start();
        }
        runtime_.scheduler->run();
    } catch (const std::exception& exc) {
        logger_.error("daemon_failed", {{"error", exc.what()}});
        shutdown_monitoring();
        throw;
    }
    shutdown_monitoring();
    logger_.info("daemon_stopped", {{"ticks", std::to_string(runtime_.scheduler->ticks())}});
}

void FanDaemon::stop() {
    runtime_.scheduler->stop();
}

const FandRuntime& FanDaemon::runtime() const {
    return runtime_;
}

void FanDaemon::shutdown_monitoring() {
    if (runtime_.acceptor) {
        runtime_.acceptor->stop();
    }
    if (runtime_.hub) {
        runtime_.hub->stop();
    }
}

}  // namespace fand
