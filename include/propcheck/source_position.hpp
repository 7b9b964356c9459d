#pragma once

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace propcheck {

// Call-site token carried into failure reports
struct source_position {
    std::string file_name{};
    std::uint_least32_t line{0};

    source_position() = default;

    source_position(std::string file, std::uint_least32_t line_number)
        : file_name(std::move(file))
        , line(line_number) {}

    // Implicit so that a defaulted std::source_location::current() argument
    // records the caller of the checking function
    source_position(const std::source_location& location)
        : file_name(base_name(location.file_name()))
        , line(location.line()) {}

    auto is_known() const -> bool {
        return !file_name.empty();
    }

    // "file.cpp:42"
    auto to_string() const -> std::string {
        return file_name + ":" + std::to_string(line);
    }

    auto operator==(const source_position&) const -> bool = default;

private:
    static auto base_name(std::string_view path) -> std::string {
        auto slash = path.find_last_of("/\\");
        if (slash == std::string_view::npos) {
            return std::string(path);
        }
        return std::string(path.substr(slash + 1));
    }
};

} // namespace propcheck
