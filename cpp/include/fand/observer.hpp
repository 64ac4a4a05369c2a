#ifndef FAND_OBSERVER_HPP
#define FAND_OBSERVER_HPP

#include <map>
#include <optional>
#include <string>

namespace fand {

// Client side of the monitoring socket: connects and yields one line at a
// time, without the trailing newline.
class ObserverConnection {
public:
    explicit ObserverConnection(const std::string& socket_path);
    ~ObserverConnection();

    ObserverConnection(const ObserverConnection&) = delete;
    ObserverConnection& operator=(const ObserverConnection&) = delete;

    std::optional<std::string> read_line();
    void close();

private:
    int fd_ = -1;
    std::string buffer_;
};

// Parses a flat JSON object whose values are all numbers (as published by
// the PID stage). Returns nothing if any value is not numeric.
std::optional<std::map<std::string, double>> parse_numeric_object(const std::string& text);

}  // namespace fand

#endif  // FAND_OBSERVER_HPP
