#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace propcheck {

// Base exception for all property check errors
class propcheck_exception : public std::runtime_error {
public:
    explicit propcheck_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid check_parameters or default seed; raised before the first iteration
class configuration_exception : public propcheck_exception {
public:
    explicit configuration_exception(const std::string& message)
        : propcheck_exception(message) {}
};

// Raised from inside a predicate to drop the current generated case.
// The check loop catches exactly this type and counts a discard.
class discarded_evaluation : public propcheck_exception {
public:
    discarded_evaluation()
        : propcheck_exception("Property evaluation was discarded") {}
};

// Runs body only when condition holds, otherwise discards the case
template<typename F>
auto whenever(bool condition, F&& body) -> decltype(std::forward<F>(body)()) {
    if (!condition) {
        throw discarded_evaluation();
    }
    return std::forward<F>(body)();
}

} // namespace propcheck
