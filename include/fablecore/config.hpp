#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "logging.hpp"

namespace fablecore {

/// Runtime settings, read from FABLECORE_* environment variables.
struct Config {
    int port = 50710;
    std::string data_dir = "./sessions";
    std::chrono::milliseconds narration_timeout{30000};
    std::size_t token_buffer = 64;
    std::optional<std::uint64_t> rng_seed;
    LogLevel log_level = LogLevel::Info;

    /// Build a Config from the process environment. Throws ValidationError
    /// when a variable is present but malformed.
    static Config from_env();
};

/// Parse "debug", "info", "warn" or "error".
LogLevel parse_log_level(const std::string& text);

} // namespace fablecore
