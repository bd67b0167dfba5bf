#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace approval {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

/// Write one JSON log line. Caller fields are merged over the base keys.
inline void log_entry(const std::string& level, const std::string& domain,
                      const std::string& message, const nlohmann::json& fields = {}) {
    nlohmann::json entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        entry[key] = value;
    }
    std::cout << entry.dump() << std::endl;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("warn", domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_entry("error", domain, message, fields);
}

} // namespace approval
