#ifndef FAND_LOGGING_HPP
#define FAND_LOGGING_HPP

#include <map>
#include <string>

#include "fand/config.hpp"

namespace fand {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& message, const LogFields& extra = {}) const;

    void debug(const std::string& message, const LogFields& extra = {}) const;
    void info(const std::string& message, const LogFields& extra = {}) const;
    void warn(const std::string& message, const LogFields& extra = {}) const;
    void error(const std::string& message, const LogFields& extra = {}) const;

    bool enabled(LogLevel level) const;
    const std::string& name() const;

private:
    std::string name_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace fand

#endif  // FAND_LOGGING_HPP
