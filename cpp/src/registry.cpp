#include "fand/registry.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace fand {

SubscriberAcceptor::SubscriberAcceptor(std::string socket_path, std::shared_ptr<SubscriberSet> subscribers,
                                       Logger logger)
    : socket_path_(std::move(socket_path)), subscribers_(std::move(subscribers)), logger_(std::move(logger)) {
    if (!subscribers_) {
        throw std::invalid_argument("subscriber acceptor requires a subscriber set");
    }
}

SubscriberAcceptor::~SubscriberAcceptor() {
    stop();
}

void SubscriberAcceptor::start() {
    if (running_) {
        return;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path_.empty() || socket_path_.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("invalid monitor socket path: " + socket_path_);
    }
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("unable to create monitor socket: ") + std::strerror(errno));
    }

    // A socket file left behind by a previous run would make bind fail.
    ::unlink(socket_path_.c_str());

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("unable to bind monitor socket " + socket_path_ + ": " + reason);
    }
    if (::listen(fd, 16) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        ::unlink(socket_path_.c_str());
        throw std::runtime_error("unable to listen on monitor socket " + socket_path_ + ": " + reason);
    }

    server_fd_ = fd;
    running_ = true;
    thread_ = std::thread(&SubscriberAcceptor::serve, this);
    logger_.info("monitor_listening", {{"socket", socket_path_}});
}

void SubscriberAcceptor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    ::unlink(socket_path_.c_str());
}

bool SubscriberAcceptor::running() const {
    return running_;
}

const std::string& SubscriberAcceptor::socket_path() const {
    return socket_path_;
}

std::size_t SubscriberAcceptor::accepted() const {
    return accepted_.load();
}

void SubscriberAcceptor::serve() {
    while (running_) {
        const int client_fd = ::accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (!running_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            logger_.error("monitor_accept_failed", {{"error", std::strerror(errno)}});
            break;
        }
        accepted_ += 1;
        subscribers_->add(std::make_unique<SocketSubscriber>(client_fd));
    }
}

}  // namespace fand
