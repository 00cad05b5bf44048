#ifndef FUSIONML_COMMON_HPP
#define FUSIONML_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fusionml {

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

inline std::string iso8601_utc_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const std::time_t seconds = clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            now.time_since_epoch() - std::chrono::seconds(seconds))
                            .count();

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[32] = {0};
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char buffer[48] = {0};
    std::snprintf(buffer, sizeof(buffer), "%s.%06lld+00:00", date, static_cast<long long>(micros));
    return buffer;
}

}  // namespace fusionml

#endif  // FUSIONML_COMMON_HPP
