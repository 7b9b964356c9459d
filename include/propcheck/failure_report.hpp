#pragma once

#include <propcheck/exceptions.hpp>
#include <propcheck/property_argument.hpp>
#include <propcheck/source_position.hpp>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace propcheck {

// Everything an asserting strategy needs to signal a failed or exhausted check
struct failure_report {
    // Full multi-line message
    std::string message;
    // Message without the location and cause decoration
    std::string undecorated_message;
    std::vector<property_argument> arguments;
    std::vector<std::string> labels;
    std::exception_ptr cause{};
    source_position position{};
};

// Raised by the throwing strategies when a property does not hold
class property_check_failed_exception : public propcheck_exception {
public:
    explicit property_check_failed_exception(failure_report report)
        : propcheck_exception(report.message)
        , _report(std::move(report)) {}

    auto undecorated_message() const -> const std::string& {
        return _report.undecorated_message;
    }

    auto arguments() const -> const std::vector<property_argument>& {
        return _report.arguments;
    }

    auto labels() const -> const std::vector<std::string>& {
        return _report.labels;
    }

    // Null when the predicate returned a failing value instead of raising
    auto cause() const -> std::exception_ptr {
        return _report.cause;
    }

    auto position() const -> const source_position& {
        return _report.position;
    }

private:
    failure_report _report;
};

} // namespace propcheck
