#pragma once

#include <propcheck/asserting.hpp>
#include <propcheck/configuration.hpp>
#include <propcheck/exceptions.hpp>
#include <propcheck/future.hpp>
#include <propcheck/generator.hpp>
#include <propcheck/logger.hpp>
#include <propcheck/property_argument.hpp>
#include <propcheck/property_check_result.hpp>
#include <propcheck/randomizer.hpp>
#include <propcheck/size.hpp>

#include <folly/Executor.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace propcheck {

// Largest number of generated arguments a predicate may take
inline constexpr std::size_t max_arity = 6;

namespace detail {

// Everything that changes between iterations of one check
template<typename... Gens>
struct loop_state {
    std::size_t succeeded{0};
    std::size_t discarded{0};
    std::tuple<std::vector<generator_value_t<Gens>>...> edges;
    randomizer rnd;
    std::vector<std::size_t> sizes;
    std::size_t size_cursor{0};
};

template<typename Gen>
auto init_edges_into(
    const Gen& gen,
    std::size_t max_edges,
    std::vector<generator_value_t<Gen>>& pool,
    randomizer& rnd
) -> void {
    auto initial = gen.init_edges(max_edges, rnd);
    pool = std::move(initial.first);
    rnd = initial.second;
}

// Seed, plan sizes, then collect edge cases generator by generator
template<typename... Gens, std::size_t... I>
auto start_check(
    const check_parameters& params,
    const std::tuple<const Gens&...>& gens,
    std::index_sequence<I...>
) -> loop_state<Gens...> {
    auto start = params.seed.has_value() ? randomizer(*params.seed) : default_randomizer();
    auto planned = plan_sizes(params.min_size, params.max_size(), start);

    loop_state<Gens...> state{
        .succeeded = 0,
        .discarded = 0,
        .edges = {},
        .rnd = planned.second,
        .sizes = std::move(planned.first),
        .size_cursor = 0
    };

    (init_edges_into(std::get<I>(gens), params.max_edges(), std::get<I>(state.edges), state.rnd), ...);
    return state;
}

// Planned sizes first, then uniform draws in [min_size, max_size]
template<typename... Gens>
auto next_size(const check_parameters& params, loop_state<Gens...>& state) -> std::size_t {
    if (state.size_cursor < state.sizes.size()) {
        return state.sizes[state.size_cursor++];
    }
    auto drawn = state.rnd.choose_size(params.min_size, params.max_size());
    state.rnd = drawn.second;
    return drawn.first;
}

template<std::size_t I, typename... Gens>
auto draw(
    const std::tuple<const Gens&...>& gens,
    loop_state<Gens...>& state,
    const size_param& size
) -> std::tuple_element_t<I, std::tuple<generator_value_t<Gens>...>> {
    auto result = std::get<I>(gens).next(size, std::move(std::get<I>(state.edges)), state.rnd);
    std::get<I>(state.edges) = std::move(result.edges);
    state.rnd = result.rnd;
    return std::move(result.value);
}

// Braced initialisation evaluates the draws in argument order
template<typename... Gens, std::size_t... I>
auto generate_values(
    const std::tuple<const Gens&...>& gens,
    loop_state<Gens...>& state,
    const size_param& size,
    std::index_sequence<I...>
) -> std::tuple<generator_value_t<Gens>...> {
    return std::tuple<generator_value_t<Gens>...>{draw<I>(gens, state, size)...};
}

template<typename... Ts, std::size_t... I>
auto record_arguments(
    const std::vector<std::string>& names,
    const std::tuple<Ts...>& values,
    std::index_sequence<I...>
) -> std::vector<property_argument> {
    auto label_for = [&names](std::size_t index) -> std::optional<std::string> {
        if (index < names.size()) {
            return names[index];
        }
        return std::nullopt;
    };

    std::vector<property_argument> arguments;
    arguments.reserve(sizeof...(Ts));
    (arguments.emplace_back(label_for(I), std::get<I>(values)), ...);
    return arguments;
}

// void predicates count as returning the assertion token
template<typename Fun, typename... Ts>
auto evaluate(Fun& fun, std::tuple<Ts...>& values) {
    using R = decltype(std::apply(fun, values));
    if constexpr (std::is_void_v<R>) {
        std::apply(fun, values);
        return assertion{};
    } else {
        return std::apply(fun, values);
    }
}

template<diagnostic_logger Logger>
auto log_start(Logger& logger, const check_parameters& params, std::int64_t seed, std::size_t arity) -> void {
    auto min_successful = std::to_string(params.min_successful);
    auto max_discarded = std::to_string(params.max_discarded());
    auto sizes = "[" + std::to_string(params.min_size) + ", " + std::to_string(params.max_size()) + "]";
    auto seed_text = std::to_string(seed);
    auto arity_text = std::to_string(arity);

    logger.log(log_level::debug, "Starting property check", {
        {"arity", arity_text},
        {"min_successful", min_successful},
        {"max_discarded", max_discarded},
        {"sizes", sizes},
        {"seed", seed_text}
    });
}

template<diagnostic_logger Logger>
auto log_outcome(Logger& logger, const property_check_result& result, std::size_t succeeded, std::size_t discarded) -> void {
    auto succeeded_text = std::to_string(succeeded);
    auto discarded_text = std::to_string(discarded);
    log_fields fields{{"succeeded", succeeded_text}, {"discarded", discarded_text}};

    if (is_success(result)) {
        logger.log(log_level::debug, "Property check succeeded", fields);
    } else if (is_exhausted(result)) {
        logger.log(log_level::warning, "Property check exhausted its discard budget", fields);
    } else {
        logger.log(log_level::info, "Property falsified", fields);
    }
}

// Counts one discard; returns the terminal result once the budget is spent
template<diagnostic_logger Logger, typename... Gens>
auto on_discard(
    Logger& logger,
    loop_state<Gens...>& state,
    std::size_t max_discarded,
    const std::vector<std::string>& names,
    std::vector<property_argument>& arguments
) -> std::optional<property_check_result> {
    ++state.discarded;
    logger.trace("Discarded generated values");
    if (state.discarded < max_discarded) {
        return std::nullopt;
    }
    return property_check_result{check_exhausted{
        .succeeded = state.succeeded,
        .discarded = state.discarded,
        .names = names,
        .arguments = std::move(arguments)
    }};
}

/**
 * @brief Classify one predicate outcome
 *
 * Returns the terminal result, or nullopt when the loop should run another
 * iteration. A null result together with a null cause never happens: the
 * caller passes either a value or the raised exception.
 */
template<typename Strategy, diagnostic_logger Logger, typename... Gens>
auto classify(
    const Strategy& strategy,
    Logger& logger,
    loop_state<Gens...>& state,
    const check_parameters& params,
    const std::vector<std::string>& names,
    std::vector<property_argument>& arguments,
    const std::optional<typename Strategy::predicate_result>& result,
    bool discard_requested,
    std::exception_ptr cause
) -> std::optional<property_check_result> {
    if (discard_requested || (result.has_value() && strategy.discard(*result))) {
        return on_discard(logger, state, params.max_discarded(), names, arguments);
    }

    if (result.has_value()) {
        auto outcome = strategy.succeed(*result);
        if (outcome.success) {
            ++state.succeeded;
            if (state.succeeded < params.min_successful) {
                return std::nullopt;
            }
            return property_check_result{check_success{.arguments = std::move(arguments)}};
        }
        cause = outcome.cause;
    }

    return property_check_result{check_failure{
        .succeeded = state.succeeded,
        .cause = std::move(cause),
        .names = names,
        .arguments = std::move(arguments)
    }};
}

template<typename R>
struct deferred_value;

template<typename T>
struct deferred_value<Future<T>> {
    using type = T;
};

} // namespace detail

/**
 * @brief Run the generate-evaluate-classify loop for a synchronous predicate
 *
 * Draws one value per generator per iteration, records the arguments, then
 * evaluates fun. A discarded_evaluation raised from fun counts as a discard;
 * any other exception ends the check as a failure carrying that exception.
 *
 * @throws configuration_exception if params are invalid
 */
template<prop_checker_asserting Strategy, diagnostic_logger Logger, typename Fun, generator... Gens>
auto check_for_all(
    const Strategy& strategy,
    Logger& logger,
    const std::vector<std::string>& names,
    const check_parameters& params,
    Fun&& fun,
    const Gens&... gens
) -> property_check_result {
    static_assert(sizeof...(Gens) >= 1 && sizeof...(Gens) <= max_arity,
                  "property predicates take between 1 and 6 generated arguments");

    using predicate_result = typename Strategy::predicate_result;
    using indices = std::index_sequence_for<Gens...>;

    validate_parameters(params);

    auto generators = std::tuple<const Gens&...>(gens...);
    auto state = detail::start_check(params, generators, indices{});
    detail::log_start(logger, params, state.rnd.seed(), sizeof...(Gens));

    while (true) {
        auto size = detail::next_size(params, state);
        auto values = detail::generate_values(generators, state, size_param{0, params.max_size(), size}, indices{});
        auto arguments = detail::record_arguments(names, values, indices{});

        std::optional<predicate_result> result;
        std::exception_ptr cause;
        bool discard_requested = false;
        try {
            result.emplace(detail::evaluate(fun, values));
        } catch (const discarded_evaluation&) {
            discard_requested = true;
        } catch (...) {
            cause = std::current_exception();
        }

        auto terminal = detail::classify(
            strategy, logger, state, params, names, arguments, result, discard_requested, cause);
        if (terminal.has_value()) {
            detail::log_outcome(logger, *terminal, state.succeeded, state.discarded);
            return std::move(*terminal);
        }
    }
}

namespace detail {

// State of one deferred check; kept alive by the pending continuation
template<typename Strategy, typename Logger, typename Fun, typename... Gens>
class async_check : public std::enable_shared_from_this<async_check<Strategy, Logger, Fun, Gens...>> {
public:
    using predicate_result = typename Strategy::predicate_result;
    using indices = std::index_sequence_for<Gens...>;
    using deferred_result = std::invoke_result_t<Fun&, generator_value_t<Gens>&...>;
    using awaited_type = typename deferred_value<std::remove_cvref_t<deferred_result>>::type;

    async_check(
        Strategy strategy,
        Logger& logger,
        std::vector<std::string> names,
        check_parameters params,
        Fun fun,
        folly::Executor* executor,
        const Gens&... gens
    )
        : _strategy(std::move(strategy))
        , _logger(&logger)
        , _names(std::move(names))
        , _params(std::move(params))
        , _fun(std::move(fun))
        , _executor(executor)
        , _generators(gens...)
        , _state(start_check(_params, std::tuple<const Gens&...>(gens...), indices{})) {}

    auto seed() const -> std::int64_t {
        return _state.rnd.seed();
    }

    // Runs ready iterations inline; parks on the first pending predicate
    auto run() -> Future<property_check_result> {
        while (true) {
            auto generators = std::apply(
                [](const Gens&... gens) { return std::tuple<const Gens&...>(gens...); }, _generators);
            auto size = next_size(_params, _state);
            // Shared with the continuation: a pending predicate may still read its arguments
            auto values = std::make_shared<std::tuple<generator_value_t<Gens>...>>(
                generate_values(generators, _state, size_param{0, _params.max_size(), size}, indices{}));
            auto arguments = record_arguments(_names, *values, indices{});

            auto pending = invoke(*values);
            if (pending.isReady()) {
                auto terminal = on_completion(pending.getTry(), arguments);
                if (terminal.has_value()) {
                    return Future<property_check_result>(std::move(*terminal));
                }
                continue;
            }

            if (_executor != nullptr) {
                pending = pending.via(_executor);
            }

            auto self = this->shared_from_this();
            return pending.thenTry(
                [self, values, arguments = std::move(arguments)](Try<awaited_type> completed) mutable
                    -> Future<property_check_result> {
                    values.reset();
                    auto terminal = self->on_completion(std::move(completed), arguments);
                    if (terminal.has_value()) {
                        return Future<property_check_result>(std::move(*terminal));
                    }
                    return self->run();
                });
        }
    }

private:
    // A synchronous throw is turned into an exceptional completion
    auto invoke(std::tuple<generator_value_t<Gens>...>& values) -> Future<awaited_type> {
        try {
            return std::apply(_fun, values);
        } catch (...) {
            return FutureFactory::makeExceptionalFuture<awaited_type>(std::current_exception());
        }
    }

    auto on_completion(Try<awaited_type> completed, std::vector<property_argument>& arguments)
        -> std::optional<property_check_result> {
        std::optional<predicate_result> result;
        std::exception_ptr cause;
        bool discard_requested = false;

        if (completed.hasException()) {
            if (completed.template holds_exception<discarded_evaluation>()) {
                discard_requested = true;
            } else {
                cause = completed.exception();
            }
        } else if constexpr (std::is_void_v<awaited_type>) {
            result.emplace(assertion{});
        } else {
            result.emplace(std::move(completed.value()));
        }

        auto terminal = classify(
            _strategy, *_logger, _state, _params, _names, arguments, result, discard_requested, cause);
        if (terminal.has_value()) {
            log_outcome(*_logger, *terminal, _state.succeeded, _state.discarded);
        }
        return terminal;
    }

    Strategy _strategy;
    Logger* _logger;
    std::vector<std::string> _names;
    check_parameters _params;
    Fun _fun;
    folly::Executor* _executor;
    std::tuple<Gens...> _generators;
    loop_state<Gens...> _state;
};

} // namespace detail

/**
 * @brief Run the check loop for a predicate that returns a Future
 *
 * Each predicate future is awaited before the next iteration is generated,
 * so two evaluations of one check never overlap. Completed futures are
 * classified inline; pending ones continue on executor when one is given,
 * otherwise on the thread that completes them. Exceptional completions and
 * synchronous throws go through the same classification.
 *
 * The logger must outlive the returned future.
 *
 * @throws configuration_exception if params are invalid
 */
template<prop_checker_asserting Strategy, diagnostic_logger Logger, typename Fun, generator... Gens>
auto check_for_all_async(
    const Strategy& strategy,
    Logger& logger,
    const std::vector<std::string>& names,
    const check_parameters& params,
    Fun&& fun,
    folly::Executor* executor,
    const Gens&... gens
) -> Future<property_check_result> {
    static_assert(sizeof...(Gens) >= 1 && sizeof...(Gens) <= max_arity,
                  "property predicates take between 1 and 6 generated arguments");
    static_assert(detail::is_future_v<std::invoke_result_t<std::decay_t<Fun>&, generator_value_t<Gens>&...>>,
                  "deferred property predicates must return propcheck::Future");

    validate_parameters(params);

    using check_type = detail::async_check<Strategy, Logger, std::decay_t<Fun>, Gens...>;
    auto check = std::make_shared<check_type>(
        strategy, logger, names, params, std::forward<Fun>(fun), executor, gens...);
    detail::log_start(logger, params, check->seed(), sizeof...(Gens));
    return check->run();
}

} // namespace propcheck
