#pragma once

#include <propcheck/property_argument.hpp>

#include <cstddef>
#include <exception>
#include <string>
#include <variant>
#include <vector>

namespace propcheck {

// Predicate validated min_successful times; holds the last arguments used
struct check_success {
    std::vector<property_argument> arguments;
};

// Predicate failed or raised; cause is null when it returned a failing value
struct check_failure {
    std::size_t succeeded{0};
    std::exception_ptr cause{};
    std::vector<std::string> names;
    std::vector<property_argument> arguments;
};

// Discard budget ran out before enough successes
struct check_exhausted {
    std::size_t succeeded{0};
    std::size_t discarded{0};
    std::vector<std::string> names;
    std::vector<property_argument> arguments;
};

using property_check_result = std::variant<check_success, check_failure, check_exhausted>;

inline auto is_success(const property_check_result& result) -> bool {
    return std::holds_alternative<check_success>(result);
}

inline auto is_failure(const property_check_result& result) -> bool {
    return std::holds_alternative<check_failure>(result);
}

inline auto is_exhausted(const property_check_result& result) -> bool {
    return std::holds_alternative<check_exhausted>(result);
}

inline auto result_arguments(const property_check_result& result) -> const std::vector<property_argument>& {
    return std::visit([](const auto& r) -> const std::vector<property_argument>& {
        return r.arguments;
    }, result);
}

} // namespace propcheck
