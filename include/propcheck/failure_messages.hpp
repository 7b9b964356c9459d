#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace propcheck::failure_messages {

inline auto property_check_succeeded() -> std::string {
    return "Property check succeeded";
}

inline auto property_exception(std::string_view exception_name) -> std::string {
    return std::string(exception_name) + " was thrown during property evaluation.";
}

inline auto property_failed(std::size_t succeeded) -> std::string {
    return "Falsified after " + std::to_string(succeeded) + " successful property evaluations.";
}

inline auto thrown_exceptions_location(std::string_view location) -> std::string {
    return "Location: (" + std::string(location) + ")";
}

inline auto thrown_exceptions_message(std::string_view message) -> std::string {
    return "Message: " + std::string(message);
}

inline auto occurred_on_values() -> std::string {
    return "Occurred when passed generated values (";
}

inline auto property_check_exhausted(std::size_t succeeded, std::size_t discarded) -> std::string {
    if (succeeded == 1) {
        return "Gave up after 1 successful property evaluation. " +
               std::to_string(discarded) + " evaluations were discarded.";
    }
    return "Gave up after " + std::to_string(succeeded) + " successful property evaluations. " +
           std::to_string(discarded) + " evaluations were discarded.";
}

inline auto property_check_label(std::size_t label_count) -> std::string {
    return label_count == 1 ? "Label of failing property:" : "Labels of failing property:";
}

} // namespace propcheck::failure_messages
