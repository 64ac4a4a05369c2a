#ifndef FAND_REGISTRY_HPP
#define FAND_REGISTRY_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "fand/logging.hpp"
#include "fand/monitor.hpp"

namespace fand {

// Accepts observers on a Unix domain stream socket and registers each
// connection with the subscriber set. A new observer takes part in the
// next broadcast pass after registration; nothing sent earlier is replayed.
class SubscriberAcceptor {
public:
    SubscriberAcceptor(std::string socket_path, std::shared_ptr<SubscriberSet> subscribers,
                       Logger logger = get_logger("SubscriberAcceptor"));
    ~SubscriberAcceptor();

    SubscriberAcceptor(const SubscriberAcceptor&) = delete;
    SubscriberAcceptor& operator=(const SubscriberAcceptor&) = delete;

    // Binds and listens on the calling thread, so failures surface as
    // std::runtime_error here; accepting then continues in the background.
    void start();
    void stop();

    bool running() const;
    const std::string& socket_path() const;
    std::size_t accepted() const;

private:
    void serve();

    std::string socket_path_;
    std::shared_ptr<SubscriberSet> subscribers_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> accepted_{0};
    std::thread thread_;
    int server_fd_ = -1;
};

}  // namespace fand

#endif  // FAND_REGISTRY_HPP
