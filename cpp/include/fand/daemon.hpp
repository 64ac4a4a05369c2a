#ifndef FAND_DAEMON_HPP
#define FAND_DAEMON_HPP

#include "fand/api.hpp"

namespace fand {

class FanDaemon {
public:
    explicit FanDaemon(FandRuntime runtime);

    // Starts monitoring (when configured) and drives the scheduler on the
    // calling thread until it stops. Acquisition and sink failures
    // propagate after monitoring has been shut down.
    void run();
    void stop();

    const FandRuntime& runtime() const;

private:
    void shutdown_monitoring();

    FandRuntime runtime_;
    Logger logger_;
};

}  // namespace fand

#endif  // FAND_DAEMON_HPP
