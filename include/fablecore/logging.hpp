#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace fablecore {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

namespace logging_detail {
inline std::atomic<int> min_level{static_cast<int>(LogLevel::Info)};
inline std::mutex output_mutex;
}  // namespace logging_detail

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline void set_log_level(LogLevel level) {
    logging_detail::min_level.store(static_cast<int>(level));
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= logging_detail::min_level.load();
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

inline void log(LogLevel level, const std::string& component, const std::string& message,
                const nlohmann::json& fields = {}) {
    if (!log_enabled(level)) return;

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    std::lock_guard<std::mutex> lock(logging_detail::output_mutex);
    std::cout << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, component, message, fields);
}

}  // namespace fablecore
