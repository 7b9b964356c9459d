#pragma once

#include <propcheck/asserting.hpp>
#include <propcheck/check_loop.hpp>
#include <propcheck/configuration.hpp>
#include <propcheck/generator.hpp>
#include <propcheck/logger.hpp>
#include <propcheck/prettifier.hpp>
#include <propcheck/property_check_result.hpp>
#include <propcheck/reporter.hpp>
#include <propcheck/source_position.hpp>

#include <folly/Executor.h>

#include <optional>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace propcheck {

using arg_names_override = std::optional<std::vector<std::string>>;

/**
 * @brief Entry point for running property checks
 *
 * Holds the check parameters, the prettifier used for failure reports and
 * the logger the check loop reports to. check1..check6 pick the asserting
 * strategy from the predicate's return type:
 *
 *   void / assertion / other values -> throws on failure, returns assertion
 *   bool                            -> false is a failure
 *   fact                            -> returns fact::yes / fact::no
 *   Future<T>                       -> Future of the strategy for T
 *
 * Deferred checks keep a reference to the logger, so the checker must
 * outlive the futures it returns.
 *
 * @tparam Logger Logger type satisfying diagnostic_logger
 */
template<diagnostic_logger Logger = noop_logger>
class property_checker {
public:
    explicit property_checker(
        check_parameters params = {},
        prettifier pretty = {},
        Logger logger = Logger{}
    )
        : _params(std::move(params))
        , _prettifier(std::move(pretty))
        , _logger(std::move(logger)) {}

    property_checker(const property_checker&) = delete;
    property_checker& operator=(const property_checker&) = delete;

    template<typename Fun, generator GA>
    auto check1(
        Fun&& fun,
        const GA& gen_a,
        std::vector<std::string> names = {},
        arg_names_override arg_names = std::nullopt,
        source_position position = std::source_location::current()
    ) {
        return check_deduced(std::move(names), std::move(arg_names), std::move(position),
                             std::forward<Fun>(fun), gen_a);
    }

    template<typename Fun, generator GA, generator GB>
    auto check2(
        Fun&& fun,
        const GA& gen_a,
        const GB& gen_b,
        std::vector<std::string> names = {},
        arg_names_override arg_names = std::nullopt,
        source_position position = std::source_location::current()
    ) {
        return check_deduced(std::move(names), std::move(arg_names), std::move(position),
                             std::forward<Fun>(fun), gen_a, gen_b);
    }

    template<typename Fun, generator GA, generator GB, generator GC>
    auto check3(
        Fun&& fun,
        const GA& gen_a,
        const GB& gen_b,
        const GC& gen_c,
        std::vector<std::string> names = {},
        arg_names_override arg_names = std::nullopt,
        source_position position = std::source_location::current()
    ) {
        return check_deduced(std::move(names), std::move(arg_names), std::move(position),
                             std::forward<Fun>(fun), gen_a, gen_b, gen_c);
    }

    template<typename Fun, generator GA, generator GB, generator GC, generator GD>
    auto check4(
        Fun&& fun,
        const GA& gen_a,
        const GB& gen_b,
        const GC& gen_c,
        const GD& gen_d,
        std::vector<std::string> names = {},
        arg_names_override arg_names = std::nullopt,
        source_position position = std::source_location::current()
    ) {
        return check_deduced(std::move(names), std::move(arg_names), std::move(position),
                             std::forward<Fun>(fun), gen_a, gen_b, gen_c, gen_d);
    }

    template<typename Fun, generator GA, generator GB, generator GC, generator GD, generator GE>
    auto check5(
        Fun&& fun,
        const GA& gen_a,
        const GB& gen_b,
        const GC& gen_c,
        const GD& gen_d,
        const GE& gen_e,
        std::vector<std::string> names = {},
        arg_names_override arg_names = std::nullopt,
        source_position position = std::source_location::current()
    ) {
        return check_deduced(std::move(names), std::move(arg_names), std::move(position),
                             std::forward<Fun>(fun), gen_a, gen_b, gen_c, gen_d, gen_e);
    }

    template<typename Fun, generator GA, generator GB, generator GC, generator GD, generator GE, generator GF>
    auto check6(
        Fun&& fun,
        const GA& gen_a,
        const GB& gen_b,
        const GC& gen_c,
        const GD& gen_d,
        const GE& gen_e,
        const GF& gen_f,
        std::vector<std::string> names = {},
        arg_names_override arg_names = std::nullopt,
        source_position position = std::source_location::current()
    ) {
        return check_deduced(std::move(names), std::move(arg_names), std::move(position),
                             std::forward<Fun>(fun), gen_a, gen_b, gen_c, gen_d, gen_e, gen_f);
    }

    /**
     * @brief Run a check with an explicitly chosen strategy
     *
     * Deferred strategies run the loop through check_for_all_async and
     * return a Future; all others block until the check is done.
     */
    template<prop_checker_asserting Strategy, typename Fun, generator... Gens>
    auto check_with(
        const Strategy& strategy,
        const std::vector<std::string>& names,
        const arg_names_override& arg_names,
        const source_position& position,
        Fun&& fun,
        const Gens&... gens
    ) -> typename Strategy::result_type {
        if constexpr (deferred_prop_checker_asserting<Strategy>) {
            return run_deferred(strategy, nullptr, names, arg_names, position, std::forward<Fun>(fun), gens...);
        } else {
            auto result = check_for_all(strategy, _logger, names, _params, std::forward<Fun>(fun), gens...);
            return check_result(strategy, result, _prettifier, position, arg_names);
        }
    }

    // Deferred check whose continuations run on executor
    template<typename Fun, generator... Gens>
    auto check_async_via(
        folly::Executor* executor,
        const std::vector<std::string>& names,
        const arg_names_override& arg_names,
        const source_position& position,
        Fun&& fun,
        const Gens&... gens
    ) {
        using result_type = std::invoke_result_t<std::decay_t<Fun>&, generator_value_t<Gens>&...>;
        static_assert(detail::is_future_v<result_type>,
                      "check_async_via needs a predicate returning propcheck::Future");
        using strategy_type = asserting_for_t<result_type>;
        if (executor == nullptr) {
            throw configuration_exception("check_async_via requires an executor");
        }
        return run_deferred(strategy_type{}, executor, names, arg_names, position, std::forward<Fun>(fun), gens...);
    }

    auto parameters() const -> const check_parameters& {
        return _params;
    }

    auto pretty() const -> const prettifier& {
        return _prettifier;
    }

    auto logger() -> Logger& {
        return _logger;
    }

private:
    template<typename Fun, typename... Gens>
    auto check_deduced(
        std::vector<std::string> names,
        arg_names_override arg_names,
        source_position position,
        Fun&& fun,
        const Gens&... gens
    ) {
        using result_type = std::invoke_result_t<std::decay_t<Fun>&, generator_value_t<Gens>&...>;
        using strategy_type = asserting_for_t<result_type>;
        return check_with(strategy_type{}, names, arg_names, position, std::forward<Fun>(fun), gens...);
    }

    template<typename Strategy, typename Fun, typename... Gens>
    auto run_deferred(
        const Strategy& strategy,
        folly::Executor* executor,
        const std::vector<std::string>& names,
        const arg_names_override& arg_names,
        const source_position& position,
        Fun&& fun,
        const Gens&... gens
    ) -> typename Strategy::result_type {
        auto pending = check_for_all_async(
            strategy, _logger, names, _params, std::forward<Fun>(fun), executor, gens...);
        return pending.thenValue(
            [strategy, pretty = _prettifier, position, arg_names](property_check_result result) {
                return check_result(strategy, result, pretty, position, arg_names);
            });
    }

    check_parameters _params;
    prettifier _prettifier;
    Logger _logger;
};

} // namespace propcheck
