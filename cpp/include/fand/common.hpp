#ifndef FAND_COMMON_HPP
#define FAND_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fand {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

// Shortest text that reads back as the same double, used on the monitoring
// wire and in state snapshots.
inline std::string format_number(double value) {
    for (int precision = std::numeric_limits<double>::digits10;
         precision < std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream out;
        out << std::setprecision(precision) << value;
        if (std::strtod(out.str().c_str(), nullptr) == value) {
            return out.str();
        }
    }
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return out.str();
}

// Thousandths of `value`, truncated toward zero. NaN maps to 0 and
// out-of-range values saturate.
inline std::int64_t to_fixed_point(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    const double scaled = value * 1000.0;
    constexpr double kMax = 9.2e18;
    if (scaled >= kMax) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (scaled <= -kMax) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return static_cast<std::int64_t>(scaled);
}

inline double from_fixed_point(std::int64_t value) {
    return static_cast<double>(value) / 1000.0;
}

}  // namespace fand

#endif  // FAND_COMMON_HPP
