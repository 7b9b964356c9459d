#pragma once

#include <propcheck/logger.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace propcheck {

// Console logger for property check diagnostics.
// Thread-safe; error and critical go to stderr, everything else to stdout.
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info)
        : _min_level(min_level) {}

    console_logger(console_logger&& other) noexcept
        : _min_level(other._min_level.load()) {}

    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _min_level = other._min_level.load();
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        if (level < _min_level) {
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " "
               << level_to_string(level) << " [propcheck]: "
               << message << "\n";
        stream.flush();
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        if (level < _min_level) {
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " "
               << level_to_string(level) << " [propcheck]: "
               << message;

        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }

        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto critical(std::string_view message) -> void { log(log_level::critical, message); }

    auto set_min_level(log_level level) -> void {
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level;
    }

    [[nodiscard]] static auto level_to_string(log_level level) -> std::string_view {
        switch (level) {
            case log_level::trace:    return "TRACE";
            case log_level::debug:    return "DEBUG";
            case log_level::info:     return "INFO";
            case log_level::warning:  return "WARNING";
            case log_level::error:    return "ERROR";
            case log_level::critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

private:
    std::atomic<log_level> _min_level;
    mutable std::mutex _mutex;

    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (level >= log_level::error) {
            return std::cerr;
        }
        return std::cout;
    }

    [[nodiscard]] auto format_timestamp() const -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_time{};
        localtime_r(&time_t_now, &local_time);

        std::ostringstream oss;
        oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace propcheck
