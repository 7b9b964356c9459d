#pragma once

#include <propcheck/fact.hpp>
#include <propcheck/failure_report.hpp>
#include <propcheck/future.hpp>

#include <concepts>
#include <exception>
#include <string>
#include <utility>

namespace propcheck {

// Outcome of succeed(): cause is only meaningful when success is false
struct classification {
    bool success{false};
    std::exception_ptr cause{};
};

// Success token of the throwing strategies
struct assertion {
    auto operator==(const assertion&) const -> bool = default;
};

inline constexpr assertion succeeded{};

/**
 * @brief Policy binding a predicate result type to the check loop
 *
 * discard() and succeed() classify one predicate result; indicate_success()
 * and indicate_failure() turn the terminal classification into whatever the
 * caller of the check receives.
 */
template<typename S>
concept prop_checker_asserting = requires(
    S strategy,
    const typename S::predicate_result& result,
    std::string message,
    failure_report report
) {
    typename S::predicate_result;
    typename S::result_type;

    { strategy.discard(result) } -> std::same_as<bool>;
    { strategy.succeed(result) } -> std::same_as<classification>;
    { strategy.indicate_success(message) } -> std::same_as<typename S::result_type>;
    { strategy.indicate_failure(std::move(report)) } -> std::same_as<typename S::result_type>;
};

// Strategy whose predicate hands back a Future and whose result is deferred too
template<typename S>
concept deferred_prop_checker_asserting = prop_checker_asserting<S> && requires {
    typename S::deferred_type;
    requires std::same_as<typename S::result_type, Future<typename S::deferred_type>>;
};

// Any value the predicate returns counts as a success; failures throw
template<typename T>
struct plain_asserting {
    using predicate_result = T;
    using result_type = assertion;

    auto discard([[maybe_unused]] const predicate_result& result) const -> bool {
        return false;
    }

    auto succeed([[maybe_unused]] const predicate_result& result) const -> classification {
        return {true, nullptr};
    }

    auto indicate_success([[maybe_unused]] const std::string& message) const -> result_type {
        return succeeded;
    }

    [[noreturn]] auto indicate_failure(failure_report report) const -> result_type {
        throw property_check_failed_exception(std::move(report));
    }
};

// Predicates returning void or assertion
using assertion_asserting = plain_asserting<assertion>;

// false is a failure without a cause
struct boolean_asserting {
    using predicate_result = bool;
    using result_type = assertion;

    auto discard([[maybe_unused]] bool result) const -> bool {
        return false;
    }

    auto succeed(bool result) const -> classification {
        return {result, nullptr};
    }

    auto indicate_success([[maybe_unused]] const std::string& message) const -> result_type {
        return succeeded;
    }

    [[noreturn]] auto indicate_failure(failure_report report) const -> result_type {
        throw property_check_failed_exception(std::move(report));
    }
};

// VacuousYes discards, Yes succeeds, No fails; signals by returning a fact
struct fact_asserting {
    using predicate_result = fact;
    using result_type = fact;

    auto discard(const fact& result) const -> bool {
        return result.is_vacuous_yes();
    }

    auto succeed(const fact& result) const -> classification {
        if (result.get_kind() == fact::kind::yes) {
            return {true, nullptr};
        }
        return {false, result.cause()};
    }

    auto indicate_success(const std::string& message) const -> result_type {
        return fact::yes(message);
    }

    auto indicate_failure(failure_report report) const -> result_type {
        return fact::no(std::move(report.message), std::move(report.cause));
    }
};

/**
 * @brief Deferred strategy for predicates returning Future<T>
 *
 * Classification is delegated to Inner on the awaited value. Signalling runs
 * inside a future completion, so a throwing Inner yields an exceptional
 * future rather than throwing at the call site.
 */
template<prop_checker_asserting Inner>
struct future_asserting {
    using inner_strategy = Inner;
    using predicate_result = typename Inner::predicate_result;
    using deferred_type = typename Inner::result_type;
    using result_type = Future<deferred_type>;

    Inner inner{};

    auto discard(const predicate_result& result) const -> bool {
        return inner.discard(result);
    }

    auto succeed(const predicate_result& result) const -> classification {
        return inner.succeed(result);
    }

    auto indicate_success(std::string message) const -> result_type {
        return FutureFactory::makeFuture().thenValue(
            [strategy = inner, message = std::move(message)]() {
                return strategy.indicate_success(message);
            });
    }

    auto indicate_failure(failure_report report) const -> result_type {
        return FutureFactory::makeFuture().thenValue(
            [strategy = inner, report = std::move(report)]() mutable {
                return strategy.indicate_failure(std::move(report));
            });
    }
};

// Compile-time strategy selection from the predicate's return type
template<typename R>
struct asserting_for {
    using type = plain_asserting<R>;
};

template<>
struct asserting_for<void> {
    using type = assertion_asserting;
};

template<>
struct asserting_for<assertion> {
    using type = assertion_asserting;
};

template<>
struct asserting_for<bool> {
    using type = boolean_asserting;
};

template<>
struct asserting_for<fact> {
    using type = fact_asserting;
};

template<typename T>
struct asserting_for<Future<T>> {
    using type = future_asserting<typename asserting_for<T>::type>;
};

template<typename R>
using asserting_for_t = typename asserting_for<std::remove_cvref_t<R>>::type;

static_assert(prop_checker_asserting<assertion_asserting>);
static_assert(prop_checker_asserting<boolean_asserting>);
static_assert(prop_checker_asserting<fact_asserting>);
static_assert(deferred_prop_checker_asserting<future_asserting<fact_asserting>>);

} // namespace propcheck
