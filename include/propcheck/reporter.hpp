#pragma once

#include <propcheck/asserting.hpp>
#include <propcheck/failure_messages.hpp>
#include <propcheck/failure_report.hpp>
#include <propcheck/prettifier.hpp>
#include <propcheck/property_argument.hpp>
#include <propcheck/property_check_result.hpp>
#include <propcheck/source_position.hpp>

#include <folly/ExceptionWrapper.h>

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace propcheck {

// Class name reported on the first line of a falsified property
inline constexpr const char* failure_exception_name = "property_check_failed_exception";

// One "    name = value" line per argument; unlabelled arguments are argN
inline auto pretty_args(const std::vector<property_argument>& arguments, const prettifier& pretty) -> std::string {
    std::string result;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        const auto& label = arguments[i].label();
        auto name = (label.has_value() && !label->empty()) ? *label : "arg" + std::to_string(i);

        if (i > 0) {
            result += "\n";
        }
        result += "    " + name + " = " + arguments[i].render(pretty);
        if (i + 1 < arguments.size()) {
            result += ",";
        }
    }
    return result;
}

// Relabels positionally, but only when the override has one name per argument
inline auto args_with_specified_names(
    const std::optional<std::vector<std::string>>& arg_names,
    const std::vector<property_argument>& arguments
) -> std::vector<property_argument> {
    if (!arg_names.has_value() || arg_names->size() != arguments.size()) {
        return arguments;
    }

    std::vector<property_argument> relabelled;
    relabelled.reserve(arguments.size());
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        relabelled.push_back(arguments[i].with_label((*arg_names)[i]));
    }
    return relabelled;
}

inline auto label_display(const std::vector<std::string>& labels) -> std::string {
    if (labels.empty()) {
        return "";
    }

    std::string result = "\n  " + failure_messages::property_check_label(labels.size()) + "\n";
    for (std::size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) {
            result += "\n";
        }
        result += "    " + labels[i];
    }
    return result;
}

inline auto exhausted_message(const check_exhausted& exhausted) -> std::string {
    return failure_messages::property_check_exhausted(exhausted.succeeded, exhausted.discarded);
}

// Multi-line report of a falsified property
inline auto failure_message(
    const check_failure& failure,
    const prettifier& pretty,
    const source_position& position,
    const std::optional<std::vector<std::string>>& arg_names,
    const std::vector<std::string>& labels = {}
) -> std::string {
    std::string message = failure_messages::property_exception(failure_exception_name) + "\n";
    if (position.is_known()) {
        message += " (" + position.to_string() + ")";
    }
    message += "\n";
    message += "  " + failure_messages::property_failed(failure.succeeded) + "\n";

    if (position.is_known()) {
        message += "  " + failure_messages::thrown_exceptions_location(position.to_string()) + "\n";
    }

    if (failure.cause) {
        folly::exception_wrapper cause(failure.cause);
        cause.with_exception([&message](const std::exception& e) {
            message += "  " + failure_messages::thrown_exceptions_message(e.what()) + "\n";
        });
    }

    message += "  " + failure_messages::occurred_on_values() + "\n";
    message += pretty_args(args_with_specified_names(arg_names, failure.arguments), pretty) + "\n";
    message += "  )";
    message += label_display(labels);
    return message;
}

/**
 * @brief Render a terminal check result through an asserting strategy
 *
 * Success reports a fixed message. Exhausted reports the succeeded and
 * discarded counts without a cause. Failure reports the full multi-line
 * message and carries the original cause. The rendering is a pure function
 * of its inputs.
 */
template<prop_checker_asserting Strategy>
auto check_result(
    const Strategy& strategy,
    const property_check_result& result,
    const prettifier& pretty,
    const source_position& position,
    const std::optional<std::vector<std::string>>& arg_names = std::nullopt
) -> typename Strategy::result_type {
    if (const auto* exhausted = std::get_if<check_exhausted>(&result)) {
        auto message = exhausted_message(*exhausted);
        return strategy.indicate_failure(failure_report{
            .message = message,
            .undecorated_message = message,
            .arguments = {},
            .labels = {},
            .cause = nullptr,
            .position = position
        });
    }

    if (const auto* failure = std::get_if<check_failure>(&result)) {
        return strategy.indicate_failure(failure_report{
            .message = failure_message(*failure, pretty, position, arg_names),
            .undecorated_message = failure_messages::property_failed(failure->succeeded),
            .arguments = failure->arguments,
            .labels = {},
            .cause = failure->cause,
            .position = position
        });
    }

    return strategy.indicate_success(failure_messages::property_check_succeeded());
}

} // namespace propcheck
