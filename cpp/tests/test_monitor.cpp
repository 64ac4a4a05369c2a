#include <unistd.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fand/monitor.hpp"
#include "fand/observer.hpp"
#include "fand/registry.hpp"
#include "test_helpers.hpp"

namespace {

using fand_test::expect_near;
using fand_test::expect_true;
using fand_test::wait_for;

class FakeSubscriber : public fand::Subscriber {
public:
    FakeSubscriber(std::string name, bool healthy, std::shared_ptr<std::vector<std::string>> received)
        : name_(std::move(name)), healthy_(healthy), received_(std::move(received)) {}

    bool write_line(const std::string& line) override {
        if (!healthy_) {
            return false;
        }
        received_->push_back(line);
        return true;
    }

    std::string describe() const override {
        return name_;
    }

private:
    std::string name_;
    bool healthy_ = true;
    std::shared_ptr<std::vector<std::string>> received_;
};

std::string test_socket_path(const std::string& suffix) {
    return "/tmp/fand_monitor_test_" + std::to_string(::getpid()) + "_" + suffix + ".sock";
}

void test_line_format() {
    fand::MonitorMessage state{1, "PID", "{\"P\":-10}"};
    expect_true(state.line() == "1: PID: {\"P\":-10}\n", "state line format");

    fand::MonitorMessage output{7, fand::kOutputTag, "42.5"};
    expect_true(output.line() == "7: >:42.5\n", "output line format");

    auto parsed = fand::parse_monitor_line(output.line());
    expect_true(parsed.has_value() && parsed->stage_index == 7 && parsed->is_output() && parsed->payload == "42.5",
                "output line parses back");

    auto parsed_state = fand::parse_monitor_line("1: PID: {\"P\":-10,\"I\":-2.5}");
    expect_true(parsed_state.has_value() && parsed_state->tag == "PID" &&
                    parsed_state->payload == "{\"P\":-10,\"I\":-2.5}",
                "payload keeps its own colons");

    expect_true(!fand::parse_monitor_line("no separators").has_value(), "line without index rejected");
    expect_true(!fand::parse_monitor_line("x: >:1").has_value(), "non-numeric index rejected");
    expect_true(!fand::parse_monitor_line("3 only one colon:").has_value(), "line without tag rejected");
}

void test_numeric_object() {
    auto values = fand::parse_numeric_object("{\"P\":-14,\"I\":-10,\"D\":-10,\"output\":64}");
    expect_true(values.has_value() && values->size() == 4, "numeric object parsed");
    if (values.has_value() && values->size() == 4) {
        expect_near(values->at("P"), -14.0, 0.0, "P term");
        expect_near(values->at("D"), -10.0, 0.0, "D term");
        expect_near(values->at("output"), 64.0, 0.0, "output value");
    }
    expect_true(fand::parse_numeric_object("{}").has_value(), "empty object parsed");
    expect_true(!fand::parse_numeric_object("{\"P\":null}").has_value(), "null value rejected");
    expect_true(!fand::parse_numeric_object("[1,2]").has_value(), "array rejected");
}

void test_channel() {
    fand::MessageChannel channel;
    channel.send({0, "Average", "{}"});
    channel.send({0, fand::kOutputTag, "1"});
    expect_true(channel.pending() == 2, "channel buffers messages");
    auto first = channel.receive();
    expect_true(first.has_value() && first->tag == "Average", "channel keeps send order");

    channel.close();
    expect_true(channel.closed(), "channel closed");
    channel.send({5, "Clip", "{}"});
    expect_true(channel.pending() == 1, "sends after close are dropped");
    auto second = channel.receive();
    expect_true(second.has_value() && second->tag == fand::kOutputTag, "closed channel still drains");
    expect_true(!channel.receive().has_value(), "drained closed channel ends");
    expect_true(!channel.try_receive().has_value(), "try_receive on empty channel");
}

void test_channel_producers() {
    auto channel = std::make_shared<fand::MessageChannel>();
    constexpr std::size_t kProducers = 4;
    constexpr int kMessages = 200;

    std::vector<std::thread> producers;
    for (std::size_t index = 0; index < kProducers; ++index) {
        producers.emplace_back([channel, index]() {
            fand::MonitorHandle handle(index, channel);
            for (int i = 0; i < kMessages; ++i) {
                handle.publish("seq", std::to_string(i));
            }
        });
    }

    std::vector<int> last_seen(kProducers, -1);
    bool ordered = true;
    std::size_t received = 0;
    while (received < kProducers * kMessages) {
        auto message = channel->receive();
        if (!message.has_value()) {
            break;
        }
        const int sequence = std::stoi(message->payload);
        if (sequence != last_seen[message->stage_index] + 1) {
            ordered = false;
        }
        last_seen[message->stage_index] = sequence;
        ++received;
    }
    for (auto& producer : producers) {
        producer.join();
    }
    expect_true(received == kProducers * kMessages, "every produced message received");
    expect_true(ordered, "per-producer order preserved");
}

void test_subscriber_set() {
    auto first = std::make_shared<std::vector<std::string>>();
    auto second = std::make_shared<std::vector<std::string>>();
    auto broken = std::make_shared<std::vector<std::string>>();

    fand::SubscriberSet subscribers;
    subscribers.add(std::make_unique<FakeSubscriber>("first", true, first));
    subscribers.add(std::make_unique<FakeSubscriber>("broken", false, broken));
    subscribers.add(std::make_unique<FakeSubscriber>("second", true, second));
    subscribers.add(nullptr);
    expect_true(subscribers.size() == 3, "null subscriber ignored");

    expect_true(subscribers.broadcast("0: >:1\n") == 2, "healthy subscribers receive the line");
    expect_true(subscribers.size() == 2, "failed subscriber pruned");
    expect_true(subscribers.broadcast("0: >:2\n") == 2, "remaining subscribers keep receiving");
    expect_true(first->size() == 2 && second->size() == 2, "both healthy subscribers saw both lines");
    expect_true(broken->empty(), "failed subscriber saw nothing");
    expect_true((*second)[1] == "0: >:2\n", "lines arrive unchanged");
}

void test_hub() {
    auto channel = std::make_shared<fand::MessageChannel>();
    auto subscribers = std::make_shared<fand::SubscriberSet>();
    auto received = std::make_shared<std::vector<std::string>>();
    subscribers->add(std::make_unique<FakeSubscriber>("observer", true, received));

    fand::MonitorHub hub(channel, subscribers);
    hub.start();
    fand::MonitorHandle handle(3, channel);
    handle.publish("Clip", "{\"max\":100000,\"min\":30000}");
    handle.publish_output(55.5);
    expect_true(wait_for([&hub]() { return hub.dispatched() == 2; }), "hub dispatches published messages");
    hub.stop();

    expect_true(received->size() == 2, "observer received both lines");
    if (received->size() == 2) {
        expect_true((*received)[0] == "3: Clip: {\"max\":100000,\"min\":30000}\n", "state line first");
        expect_true((*received)[1] == "3: >:55.5\n", "output line second");
    }
    expect_true(channel->closed(), "stopping the hub closes the channel");

    fand::MonitorHub idle(std::make_shared<fand::MessageChannel>(), subscribers);

    auto late_channel = std::make_shared<fand::MessageChannel>();
    auto late_set = std::make_shared<fand::SubscriberSet>();
    auto early = std::make_shared<std::vector<std::string>>();
    auto late = std::make_shared<std::vector<std::string>>();
    late_set->add(std::make_unique<FakeSubscriber>("early", true, early));

    fand::MonitorHub late_hub(late_channel, late_set);
    late_hub.start();
    fand::MonitorHandle late_handle(0, late_channel);
    late_handle.publish_output(1.0);
    expect_true(wait_for([&early]() { return early->size() == 1; }), "first line broadcast before registration");
    late_set->add(std::make_unique<FakeSubscriber>("late", true, late));
    late_handle.publish_output(2.0);
    expect_true(wait_for([&late_hub]() { return late_hub.dispatched() == 2; }), "second line dispatched");
    late_hub.stop();
    expect_true(early->size() == 2, "early subscriber saw both lines");
    expect_true(late->size() == 1 && (*late)[0] == "0: >:2\n", "late subscriber only sees lines after joining");
    expect_true(idle.dispatch(fand::MonitorMessage{0, ">", "1"}) == 1, "direct dispatch broadcasts");
}

void test_acceptor_end_to_end() {
    const auto path = test_socket_path("e2e");
    auto channel = std::make_shared<fand::MessageChannel>();
    auto subscribers = std::make_shared<fand::SubscriberSet>();
    fand::SubscriberAcceptor acceptor(path, subscribers);
    fand::MonitorHub hub(channel, subscribers);
    acceptor.start();
    hub.start();
    expect_true(acceptor.running(), "acceptor running");

    fand::ObserverConnection observer(path);
    expect_true(wait_for([&subscribers]() { return subscribers->size() == 1; }), "observer registered");
    expect_true(acceptor.accepted() == 1, "acceptor counted the connection");

    fand::MonitorHandle handle(7, channel);
    handle.publish_output(64.0);
    auto line = observer.read_line();
    expect_true(line.has_value() && *line == "7: >:64", "observer reads the broadcast line");
    auto parsed = line.has_value() ? fand::parse_monitor_line(*line) : std::nullopt;
    expect_true(parsed.has_value() && parsed->stage_index == 7 && parsed->is_output(), "observer line parses");

    {
        fand::ObserverConnection leaving(path);
        expect_true(wait_for([&subscribers]() { return subscribers->size() == 2; }), "second observer registered");
    }
    std::size_t sent = 0;
    const bool pruned = wait_for([&]() {
        handle.publish("Subsample", "{\"n\":" + std::to_string(sent++) + "}");
        return subscribers->size() == 1;
    });
    expect_true(pruned, "closed observer pruned on a later broadcast");

    hub.stop();
    acceptor.stop();
    expect_true(!acceptor.running(), "acceptor stopped");
    expect_true(::access(path.c_str(), F_OK) != 0, "socket file removed on stop");

    bool refused = false;
    try {
        fand::ObserverConnection late(path);
    } catch (const std::runtime_error&) {
        refused = true;
    }
    expect_true(refused, "connecting after stop fails");
}

void test_acceptor_bind_failure() {
    auto subscribers = std::make_shared<fand::SubscriberSet>();
    fand::SubscriberAcceptor acceptor("/nonexistent_dir_fand/monitor.sock", subscribers);
    bool thrown = false;
    try {
        acceptor.start();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    expect_true(thrown, "bind failure surfaces at start");
    expect_true(!acceptor.running(), "acceptor not running after bind failure");

    fand::SubscriberAcceptor too_long(std::string(200, 'x'), subscribers);
    bool rejected = false;
    try {
        too_long.start();
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    expect_true(rejected, "overlong socket path rejected");
}

}  // namespace

int main() {
    try {
        test_line_format();
        test_numeric_object();
        test_channel();
        test_channel_producers();
        test_subscriber_set();
        test_hub();
        test_acceptor_end_to_end();
        test_acceptor_bind_failure();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    return fand_test::report();
}
