#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace propcheck {

// Log severity levels
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// Diagnostic logger concept for structured logging from the check loop
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields key_value_pairs
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
};

// Logger that drops everything; the default for property_checker
class noop_logger {
public:
    auto log([[maybe_unused]] log_level level, [[maybe_unused]] std::string_view message) -> void {}

    auto log(
        [[maybe_unused]] log_level level,
        [[maybe_unused]] std::string_view message,
        [[maybe_unused]] const log_fields& key_value_pairs
    ) -> void {}

    auto trace([[maybe_unused]] std::string_view message) -> void {}
    auto debug([[maybe_unused]] std::string_view message) -> void {}
    auto info([[maybe_unused]] std::string_view message) -> void {}
    auto warning([[maybe_unused]] std::string_view message) -> void {}
    auto error([[maybe_unused]] std::string_view message) -> void {}
    auto critical([[maybe_unused]] std::string_view message) -> void {}
};

static_assert(diagnostic_logger<noop_logger>, "noop_logger must satisfy diagnostic_logger concept");

} // namespace propcheck
