#include "fablecore/config.hpp"
#include "fablecore/errors.hpp"
#include <cstdlib>
#include <limits>

namespace fablecore {

namespace {

constexpr std::int64_t kMaxPort = 65535;

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') return std::nullopt;
    return std::string(value);
}

std::int64_t parse_integer(const char* name, const std::string& text, std::int64_t min_value,
                           std::int64_t max_value = std::numeric_limits<std::int64_t>::max()) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ValidationError(std::string(name) + " is not a number: " + text);
    }
    if (consumed != text.size()) {
        throw ValidationError(std::string(name) + " is not a number: " + text);
    }
    if (value < min_value) {
        throw ValidationError(std::string(name) + " must be at least " + std::to_string(min_value));
    }
    if (value > max_value) {
        throw ValidationError(std::string(name) + " must be at most " + std::to_string(max_value));
    }
    return value;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    throw ValidationError("Unknown log level: " + text);
}

Config Config::from_env() {
    Config config;

    if (auto port = env("FABLECORE_PORT")) {
        config.port = static_cast<int>(parse_integer("FABLECORE_PORT", *port, 1, kMaxPort));
    }
    if (auto dir = env("FABLECORE_DATA_DIR")) {
        config.data_dir = *dir;
    }
    if (auto timeout = env("FABLECORE_NARRATION_TIMEOUT_MS")) {
        config.narration_timeout = std::chrono::milliseconds(
            parse_integer("FABLECORE_NARRATION_TIMEOUT_MS", *timeout, 1));
    }
    if (auto buffer = env("FABLECORE_TOKEN_BUFFER")) {
        config.token_buffer = static_cast<std::size_t>(
            parse_integer("FABLECORE_TOKEN_BUFFER", *buffer, 1));
    }
    if (auto seed = env("FABLECORE_RNG_SEED")) {
        config.rng_seed = static_cast<std::uint64_t>(parse_integer("FABLECORE_RNG_SEED", *seed, 0));
    }
    if (auto level = env("FABLECORE_LOG_LEVEL")) {
        config.log_level = parse_log_level(*level);
    }

    return config;
}

} // namespace fablecore
