#ifndef FAND_MONITOR_HPP
#define FAND_MONITOR_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fand/logging.hpp"

namespace fand {

// Tag used for the value a stage pushed downstream on a tick.
inline constexpr const char* kOutputTag = ">";

struct MonitorMessage {
    std::size_t stage_index = 0;
    std::string tag;
    std::string payload;

    // "<index>: <tag>: <payload>\n", or "<index>: >:<value>\n" for outputs.
    std::string line() const;
};

// Decoded form of one monitoring line, as seen by an observer.
struct MonitorLine {
    std::size_t stage_index = 0;
    std::string tag;
    std::string payload;

    bool is_output() const { return tag == kOutputTag; }
};

std::optional<MonitorLine> parse_monitor_line(const std::string& line);

// Unbounded many-producer / single-consumer queue. Producers never block;
// a stalled consumer lets the backlog grow without limit.
class MessageChannel {
public:
    void send(MonitorMessage message);
    std::optional<MonitorMessage> receive();
    std::optional<MonitorMessage> try_receive();
    void close();

    bool closed() const;
    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<MonitorMessage> queue_;
    bool closed_ = false;
};

// A stage's sender: the shared channel plus the stage's position.
class MonitorHandle {
public:
    MonitorHandle(std::size_t stage_index, std::shared_ptr<MessageChannel> channel);

    void publish(const std::string& tag, std::string payload) const;
    void publish_output(double value) const;

    std::size_t stage_index() const;

private:
    std::size_t stage_index_ = 0;
    std::shared_ptr<MessageChannel> channel_;
};

class Subscriber {
public:
    virtual ~Subscriber() = default;

    // Returns false once the peer can no longer be written to.
    virtual bool write_line(const std::string& line) = 0;
    virtual std::string describe() const = 0;
};

class SocketSubscriber : public Subscriber {
public:
    explicit SocketSubscriber(int fd);
    ~SocketSubscriber() override;

    SocketSubscriber(const SocketSubscriber&) = delete;
    SocketSubscriber& operator=(const SocketSubscriber&) = delete;

    bool write_line(const std::string& line) override;
    std::string describe() const override;

private:
    int fd_ = -1;
};

// The live observer set. One lock covers both registration and a whole
// broadcast pass, writes included, so a stalled observer also stalls
// acceptance of new ones.
class SubscriberSet {
public:
    explicit SubscriberSet(Logger logger = get_logger("SubscriberSet"));

    void add(std::unique_ptr<Subscriber> subscriber);

    // Writes `line` to every subscriber and drops those whose write failed.
    // Returns the number of successful deliveries.
    std::size_t broadcast(const std::string& line);

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Subscriber>> subscribers_;
    Logger logger_;
};

class MonitorHub {
public:
    MonitorHub(std::shared_ptr<MessageChannel> channel, std::shared_ptr<SubscriberSet> subscribers,
               Logger logger = get_logger("MonitorHub"));
    ~MonitorHub();

    MonitorHub(const MonitorHub&) = delete;
    MonitorHub& operator=(const MonitorHub&) = delete;

    void start();
    void stop();

    std::size_t dispatch(const MonitorMessage& message);

    std::size_t dispatched() const;

private:
    void run();

    std::shared_ptr<MessageChannel> channel_;
    std::shared_ptr<SubscriberSet> subscribers_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> dispatched_{0};
    std::thread thread_;
};

}  // namespace fand

#endif  // FAND_MONITOR_HPP
