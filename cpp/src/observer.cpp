#include "fand/observer.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include "fand/common.hpp"

namespace fand {

ObserverConnection::ObserverConnection(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("invalid monitor socket path: " + socket_path);
    }
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        throw std::runtime_error(std::string("unable to create socket: ") + std::strerror(errno));
    }
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("failed to connect to " + socket_path + ": " + reason);
    }
}

ObserverConnection::~ObserverConnection() {
    close();
}

std::optional<std::string> ObserverConnection::read_line() {
    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            return line;
        }
        if (fd_ < 0) {
            return std::nullopt;
        }
        char chunk[512];
        const ssize_t received = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            close();
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            return line;
        }
        buffer_.append(chunk, static_cast<std::size_t>(received));
    }
}

void ObserverConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::optional<std::map<std::string, double>> parse_numeric_object(const std::string& text) {
    const auto body = trim(text);
    if (body.size() < 2 || body.front() != '{' || body.back() != '}') {
        return std::nullopt;
    }
    std::map<std::string, double> values;
    const auto inner = trim(body.substr(1, body.size() - 2));
    if (inner.empty()) {
        return values;
    }
    for (const auto& entry : split(inner, ',')) {
        const auto colon = entry.find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        const auto key = strip_quotes(trim(entry.substr(0, colon)));
        std::istringstream number(trim(entry.substr(colon + 1)));
        double value = 0.0;
        if (!(number >> value) || !number.eof()) {
            return std::nullopt;
        }
        values[key] = value;
    }
    return values;
}

}  // namespace fand
