#include "fand/monitor.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include "fand/common.hpp"

namespace fand {

std::string MonitorMessage::line() const {
    std::ostringstream out;
    out << stage_index << ": " << tag << ":";
    if (tag != kOutputTag) {
        out << " ";
    }
    out << payload << "\n";
    return out.str();
}

std::optional<MonitorLine> parse_monitor_line(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    const auto first = text.find(':');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto index_text = trim(text.substr(0, first));
    if (index_text.empty() ||
        index_text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    MonitorLine parsed;
    try {
        parsed.stage_index = static_cast<std::size_t>(std::stoull(index_text));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }

    const auto rest = text.substr(first + 1);
    const auto second = rest.find(':');
    if (second == std::string::npos) {
        return std::nullopt;
    }
    parsed.tag = trim(rest.substr(0, second));
    parsed.payload = trim(rest.substr(second + 1));
    return parsed;
}

void MessageChannel::send(MonitorMessage message) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(message));
    }
    ready_.notify_one();
}

std::optional<MonitorMessage> MessageChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    MonitorMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

std::optional<MonitorMessage> MessageChannel::try_receive() {
    std::lock_guard<std::mutex> guard(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    MonitorMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void MessageChannel::close() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool MessageChannel::closed() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return closed_;
}

std::size_t MessageChannel::pending() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return queue_.size();
}

MonitorHandle::MonitorHandle(std::size_t stage_index, std::shared_ptr<MessageChannel> channel)
    : stage_index_(stage_index), channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("monitor handle requires a channel");
    }
}

void MonitorHandle::publish(const std::string& tag, std::string payload) const {
    channel_->send(MonitorMessage{stage_index_, tag, std::move(payload)});
}

void MonitorHandle::publish_output(double value) const {
    publish(kOutputTag, format_number(value));
}

std::size_t MonitorHandle::stage_index() const {
    return stage_index_;
}

SocketSubscriber::SocketSubscriber(int fd) : fd_(fd) {}

SocketSubscriber::~SocketSubscriber() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool SocketSubscriber::write_line(const std::string& line) {
    const char* data = line.data();
    std::size_t remaining = line.size();
    while (remaining > 0) {
        const ssize_t written = ::send(fd_, data, remaining, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

std::string SocketSubscriber::describe() const {
    return "fd:" + std::to_string(fd_);
}

SubscriberSet::SubscriberSet(Logger logger) : logger_(std::move(logger)) {}

void SubscriberSet::add(std::unique_ptr<Subscriber> subscriber) {
    if (!subscriber) {
        return;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    logger_.info("subscriber_added", {{"subscriber", subscriber->describe()},
                                      {"count", std::to_string(subscribers_.size() + 1)}});
    subscribers_.push_back(std::move(subscriber));
}

std::size_t SubscriberSet::broadcast(const std::string& line) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::size_t delivered = 0;
    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
        if ((*it)->write_line(line)) {
            ++delivered;
            ++it;
        } else {
            logger_.debug("subscriber_dropped", {{"subscriber", (*it)->describe()}});
            it = subscribers_.erase(it);
        }
    }
    return delivered;
}

std::size_t SubscriberSet::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return subscribers_.size();
}

MonitorHub::MonitorHub(std::shared_ptr<MessageChannel> channel, std::shared_ptr<SubscriberSet> subscribers,
                       Logger logger)
    : channel_(std::move(channel)), subscribers_(std::move(subscribers)), logger_(std::move(logger)) {
    if (!channel_ || !subscribers_) {
        throw std::invalid_argument("monitor hub requires a channel and a subscriber set");
    }
}

MonitorHub::~MonitorHub() {
    stop();
}

void MonitorHub::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&MonitorHub::run, this);
}

void MonitorHub::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    channel_->close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::size_t MonitorHub::dispatch(const MonitorMessage& message) {
    dispatched_ += 1;
    return subscribers_->broadcast(message.line());
}

std::size_t MonitorHub::dispatched() const {
    return dispatched_.load();
}

void MonitorHub::run() {
    logger_.info("monitor_hub_started");
    while (auto message = channel_->receive()) {
        dispatch(*message);
    }
    logger_.info("monitor_hub_stopped", {{"dispatched", std::to_string(dispatched_.load())}});
}

}  // namespace fand
