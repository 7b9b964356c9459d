/**
 * @file check_loop_property_test.cpp
 * @brief Property tests for the synchronous generate-evaluate-classify loop
 *
 * **Feature: property-check-engine, Property 1: Loop Termination**
 *
 * The loop stops exactly when min_successful successes are reached, when the
 * discard budget is spent, or on the first failure, and the recorded
 * arguments always match the predicate arity.
 */

#define BOOST_TEST_MODULE CheckLoopPropertyTest
#include <boost/test/included/unit_test.hpp>

#include <propcheck/asserting.hpp>
#include <propcheck/check_loop.hpp>
#include <propcheck/configuration.hpp>
#include <propcheck/exceptions.hpp>
#include <propcheck/fact.hpp>
#include <propcheck/logger.hpp>

#include "generator_test_utilities.hpp"

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace propcheck;
using namespace test_utilities;

namespace {
    constexpr std::size_t num_property_iterations = 50;
    constexpr std::size_t max_min_successful = 60;
    constexpr std::uint32_t fixed_seed = 1234;
    constexpr std::int64_t check_seed = 77;

    const std::vector<std::string> no_names{};

    auto seeded(check_parameters params) -> check_parameters {
        params.seed = check_seed;
        return params;
    }
}

BOOST_AUTO_TEST_SUITE(check_loop_property_tests)

/**
 * Property: a predicate that always succeeds runs exactly min_successful times
 */
BOOST_AUTO_TEST_CASE(property_success_runs_exactly_min_successful_times, * boost::unit_test::timeout(60)) {
    std::mt19937 gen(fixed_seed);
    std::uniform_int_distribution<std::size_t> min_dist(1, max_min_successful);
    noop_logger logger;

    for (std::size_t i = 0; i < num_property_iterations; ++i) {
        auto params = seeded({.min_successful = min_dist(gen)});
        std::size_t calls = 0;

        auto result = check_for_all(
            assertion_asserting{}, logger, no_names, params,
            [&calls](std::int32_t) { ++calls; },
            int_range_generator{-10, 10});

        BOOST_REQUIRE(is_success(result));
        BOOST_CHECK_EQUAL(calls, params.min_successful);
        BOOST_CHECK_EQUAL(std::get<check_success>(result).arguments.size(), 1u);
    }
}

/**
 * Property: a predicate that always discards ends Exhausted at max_discarded
 */
BOOST_AUTO_TEST_CASE(property_always_discarding_exhausts_budget, * boost::unit_test::timeout(60)) {
    std::mt19937 gen(fixed_seed);
    std::uniform_int_distribution<std::size_t> min_dist(1, max_min_successful);
    std::uniform_real_distribution<double> factor_dist(0.1, 6.0);
    noop_logger logger;

    for (std::size_t i = 0; i < num_property_iterations; ++i) {
        auto params = seeded({.min_successful = min_dist(gen), .max_discarded_factor = factor_dist(gen)});
        std::size_t calls = 0;

        auto result = check_for_all(
            assertion_asserting{}, logger, no_names, params,
            [&calls](std::int32_t) {
                ++calls;
                throw discarded_evaluation();
            },
            int_range_generator{0, 100});

        BOOST_REQUIRE(is_exhausted(result));
        const auto& exhausted = std::get<check_exhausted>(result);
        BOOST_CHECK_EQUAL(exhausted.succeeded, 0u);
        BOOST_CHECK_EQUAL(exhausted.discarded, params.max_discarded());
        BOOST_CHECK_EQUAL(calls, params.max_discarded());
        BOOST_CHECK_EQUAL(exhausted.arguments.size(), 1u);
    }
}

/**
 * Property: a predicate failing on the first call reports zero successes and N arguments
 */
BOOST_AUTO_TEST_CASE(property_first_call_failure_for_every_arity, * boost::unit_test::timeout(60)) {
    noop_logger logger;
    auto params = seeded({});
    constant_generator<int> g{1};
    auto fail = [](auto&&...) -> bool { return false; };

    auto r1 = check_for_all(boolean_asserting{}, logger, no_names, params, fail, g);
    auto r2 = check_for_all(boolean_asserting{}, logger, no_names, params, fail, g, g);
    auto r3 = check_for_all(boolean_asserting{}, logger, no_names, params, fail, g, g, g);
    auto r4 = check_for_all(boolean_asserting{}, logger, no_names, params, fail, g, g, g, g);
    auto r5 = check_for_all(boolean_asserting{}, logger, no_names, params, fail, g, g, g, g, g);
    auto r6 = check_for_all(boolean_asserting{}, logger, no_names, params, fail, g, g, g, g, g, g);

    std::vector<property_check_result> results{r1, r2, r3, r4, r5, r6};
    for (std::size_t arity = 1; arity <= results.size(); ++arity) {
        const auto& result = results[arity - 1];
        BOOST_REQUIRE(is_failure(result));
        const auto& failure = std::get<check_failure>(result);
        BOOST_CHECK_EQUAL(failure.succeeded, 0u);
        BOOST_CHECK(!failure.cause);
        BOOST_CHECK_EQUAL(failure.arguments.size(), arity);
    }
}

BOOST_AUTO_TEST_CASE(test_constant_zero_scenario, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    check_parameters params{
        .min_successful = 3,
        .max_discarded_factor = 1.0,
        .min_size = 0,
        .size_range = 0
    };
    std::size_t calls = 0;

    auto result = check_for_all(
        boolean_asserting{}, logger, no_names, params,
        [&calls](int x) {
            ++calls;
            return x == 0;
        },
        constant_generator<int>{0});

    BOOST_REQUIRE(is_success(result));
    BOOST_CHECK_EQUAL(calls, 3u);
    const auto& arguments = std::get<check_success>(result).arguments;
    BOOST_REQUIRE_EQUAL(arguments.size(), 1u);
    BOOST_CHECK(!arguments[0].label().has_value());
    BOOST_CHECK_EQUAL(arguments[0].value_as<int>(), 0);
}

BOOST_AUTO_TEST_CASE(test_always_discard_scenario, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    check_parameters params{.min_successful = 3};

    auto result = check_for_all(
        fact_asserting{}, logger, no_names, params,
        [](int) { return fact::vacuous_yes(); },
        constant_generator<int>{0});

    BOOST_REQUIRE(is_exhausted(result));
    const auto& exhausted = std::get<check_exhausted>(result);
    BOOST_CHECK_EQUAL(exhausted.succeeded, 0u);
    BOOST_CHECK_EQUAL(exhausted.discarded, params.max_discarded());
    BOOST_CHECK_EQUAL(exhausted.discarded, 15u);
}

BOOST_AUTO_TEST_CASE(test_two_argument_failure_scenario, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    std::vector<std::string> names{"x", "y"};

    auto result = check_for_all(
        boolean_asserting{}, logger, names, check_parameters{},
        [](int x, int y) { return x + y == 10; },
        constant_generator<int>{4},
        constant_generator<int>{5});

    BOOST_REQUIRE(is_failure(result));
    const auto& failure = std::get<check_failure>(result);
    BOOST_CHECK_EQUAL(failure.succeeded, 0u);
    BOOST_CHECK(failure.names == names);
    BOOST_REQUIRE_EQUAL(failure.arguments.size(), 2u);
    BOOST_CHECK_EQUAL(*failure.arguments[0].label(), "x");
    BOOST_CHECK_EQUAL(failure.arguments[0].value_as<int>(), 4);
    BOOST_CHECK_EQUAL(*failure.arguments[1].label(), "y");
    BOOST_CHECK_EQUAL(failure.arguments[1].value_as<int>(), 5);
}

BOOST_AUTO_TEST_CASE(test_raised_exception_becomes_failure_cause, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    sequence_generator<int> values{{1, 2, 3, 4}};

    auto result = check_for_all(
        assertion_asserting{}, logger, no_names, seeded({}),
        [](int x) {
            if (x == 3) {
                throw std::logic_error("three");
            }
        },
        values);

    BOOST_REQUIRE(is_failure(result));
    const auto& failure = std::get<check_failure>(result);
    BOOST_CHECK_EQUAL(failure.succeeded, 2u);
    BOOST_REQUIRE(failure.cause);
    BOOST_CHECK_THROW(std::rethrow_exception(failure.cause), std::logic_error);
    BOOST_CHECK_EQUAL(failure.arguments[0].value_as<int>(), 3);
}

BOOST_AUTO_TEST_CASE(test_fact_no_carries_its_cause, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    auto cause = std::make_exception_ptr(std::runtime_error("mismatch"));

    auto result = check_for_all(
        fact_asserting{}, logger, no_names, seeded({}),
        [cause](int) { return fact::no("mismatch", cause); },
        constant_generator<int>{0});

    BOOST_REQUIRE(is_failure(result));
    BOOST_CHECK(std::get<check_failure>(result).cause == cause);
}

BOOST_AUTO_TEST_CASE(test_discards_and_successes_are_both_counted, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    sequence_generator<int> values{{1, 2}};
    std::size_t calls = 0;
    auto params = seeded({.min_successful = 5, .max_discarded_factor = 2.0});

    auto result = check_for_all(
        boolean_asserting{}, logger, no_names, params,
        [&calls](int x) {
            ++calls;
            return whenever(x % 2 == 0, [] { return true; });
        },
        values);

    BOOST_REQUIRE(is_success(result));
    // Odd and even values alternate, so every success costs one discard
    BOOST_CHECK_EQUAL(calls, 10u);
}

BOOST_AUTO_TEST_CASE(test_same_seed_same_arguments, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    auto params = seeded({.min_successful = 40});

    auto collect = [&]() {
        std::vector<std::int32_t> seen;
        auto result = check_for_all(
            assertion_asserting{}, logger, no_names, params,
            [&seen](std::int32_t x) { seen.push_back(x); },
            int_range_generator{-1000, 1000});
        BOOST_CHECK(is_success(result));
        return seen;
    };

    auto first = collect();
    auto second = collect();
    BOOST_CHECK_EQUAL(first.size(), params.min_successful);
    BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_CASE(test_edge_cases_come_first, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    std::vector<std::int32_t> seen;

    auto result = check_for_all(
        assertion_asserting{}, logger, no_names, seeded({.min_successful = 10}),
        [&seen](std::int32_t x) { seen.push_back(x); },
        int_range_generator{-1000, 1000});

    BOOST_REQUIRE(is_success(result));
    BOOST_REQUIRE_GE(seen.size(), 2u);
    BOOST_CHECK_EQUAL(seen[0], -1000);
    BOOST_CHECK_EQUAL(seen[1], 1000);
}

BOOST_AUTO_TEST_CASE(test_no_edge_cases_below_five_successes, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    size_recording_generator recorder;

    auto result = check_for_all(
        assertion_asserting{}, logger, no_names, seeded({.min_successful = 4}),
        [](std::size_t) {},
        recorder);

    BOOST_REQUIRE(is_success(result));
    BOOST_REQUIRE_EQUAL(recorder.edge_budgets->size(), 1u);
    BOOST_CHECK_EQUAL(recorder.edge_budgets->front(), 0u);
}

BOOST_AUTO_TEST_CASE(test_generators_called_in_argument_order, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    auto journal = std::make_shared<std::vector<std::string>>();

    auto result = check_for_all(
        assertion_asserting{}, logger, no_names, seeded({.min_successful = 2}),
        [](const std::string&, const std::string&, const std::string&) {},
        journal_generator{"a", journal},
        journal_generator{"b", journal},
        journal_generator{"c", journal});

    BOOST_REQUIRE(is_success(result));
    std::vector<std::string> expected{
        "init:a", "init:b", "init:c",
        "next:a", "next:b", "next:c",
        "next:a", "next:b", "next:c"
    };
    BOOST_CHECK(*journal == expected);
}

BOOST_AUTO_TEST_CASE(test_planned_sizes_then_random_sizes, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    size_recording_generator recorder;
    auto params = seeded({.min_successful = 25, .min_size = 2, .size_range = 8});

    auto result = check_for_all(
        assertion_asserting{}, logger, no_names, params,
        [](std::size_t) {},
        recorder);

    BOOST_REQUIRE(is_success(result));
    const auto& sizes = *recorder.sizes;
    BOOST_REQUIRE_EQUAL(sizes.size(), params.min_successful);
    BOOST_CHECK_EQUAL(sizes[0].size, params.min_size);

    for (std::size_t i = 0; i < sizes.size(); ++i) {
        BOOST_CHECK_EQUAL(sizes[i].min_size, 0u);
        BOOST_CHECK_EQUAL(sizes[i].size_range, params.max_size());
        BOOST_CHECK(sizes[i].size >= params.min_size);
        BOOST_CHECK(sizes[i].size <= params.max_size());
        if (i > 0 && i < planned_size_count) {
            BOOST_CHECK(sizes[i - 1].size <= sizes[i].size);
        }
    }

    BOOST_REQUIRE_EQUAL(recorder.edge_budgets->size(), 1u);
    BOOST_CHECK_EQUAL(recorder.edge_budgets->front(), params.max_edges());
}

BOOST_AUTO_TEST_CASE(test_partial_names_label_leading_arguments, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    std::vector<std::string> names{"first"};

    auto result = check_for_all(
        boolean_asserting{}, logger, names, seeded({}),
        [](int, int) { return false; },
        constant_generator<int>{1},
        constant_generator<int>{2});

    BOOST_REQUIRE(is_failure(result));
    const auto& arguments = std::get<check_failure>(result).arguments;
    BOOST_REQUIRE_EQUAL(arguments.size(), 2u);
    BOOST_CHECK_EQUAL(*arguments[0].label(), "first");
    BOOST_CHECK(!arguments[1].label().has_value());
}

BOOST_AUTO_TEST_CASE(test_invalid_parameters_rejected_before_generation, * boost::unit_test::timeout(30)) {
    noop_logger logger;
    size_recording_generator recorder;

    BOOST_CHECK_THROW(
        check_for_all(assertion_asserting{}, logger, no_names, check_parameters{.min_successful = 0},
                      [](std::size_t) {}, recorder),
        configuration_exception);
    BOOST_CHECK(recorder.sizes->empty());
    BOOST_CHECK(recorder.edge_budgets->empty());
}

BOOST_AUTO_TEST_SUITE_END()
