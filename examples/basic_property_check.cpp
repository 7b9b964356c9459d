// Example: Basic Property Checks
// This example demonstrates:
// 1. Writing a generator with edge cases for the check loop
// 2. Checking void, bool and fact predicates through property_checker
// 3. Discarding cases with whenever()
// 4. Reading the failure report of a falsified property

#include <propcheck/propcheck.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace propcheck;

namespace {
    constexpr std::int32_t int_low = -1000;
    constexpr std::int32_t int_high = 1000;
    constexpr std::size_t example_min_successful = 50;
    constexpr std::int64_t example_seed = 2024;
}

// Integers in [low, high] with zero and both bounds as edge cases
struct int_generator {
    using value_type = std::int32_t;

    std::int32_t low;
    std::int32_t high;

    auto init_edges(std::size_t max_count, randomizer rnd) const
        -> std::pair<std::vector<std::int32_t>, randomizer> {
        std::vector<std::int32_t> edges{0, low, high};
        edges.resize(std::min(max_count, edges.size()));
        return {std::move(edges), rnd};
    }

    auto next([[maybe_unused]] size_param size, std::vector<std::int32_t> edges, randomizer rnd) const
        -> generated<std::int32_t> {
        if (!edges.empty()) {
            auto value = edges.front();
            edges.erase(edges.begin());
            return {value, std::move(edges), rnd};
        }
        auto [value, next_rnd] = rnd.choose_int(low, high);
        return {value, std::move(edges), next_rnd};
    }
};

// Lower-case strings whose length grows with the size parameter
struct string_generator {
    using value_type = std::string;

    auto init_edges(std::size_t max_count, randomizer rnd) const
        -> std::pair<std::vector<std::string>, randomizer> {
        std::vector<std::string> edges{""};
        edges.resize(std::min(max_count, edges.size()));
        return {std::move(edges), rnd};
    }

    auto next(size_param size, std::vector<std::string> edges, randomizer rnd) const
        -> generated<std::string> {
        if (!edges.empty()) {
            auto value = edges.front();
            edges.erase(edges.begin());
            return {value, std::move(edges), rnd};
        }

        auto [length, after_length] = rnd.choose_size(0, size.size);
        rnd = after_length;
        std::string value;
        for (std::size_t i = 0; i < length; ++i) {
            auto [c, after_char] = rnd.choose_int('a', 'z');
            value.push_back(static_cast<char>(c));
            rnd = after_char;
        }
        return {value, std::move(edges), rnd};
    }
};

auto example_void_predicate() -> bool {
    std::cout << "Example 1: Void predicate\n";

    try {
        property_checker<console_logger> checker(
            check_parameters{.min_successful = example_min_successful, .seed = example_seed},
            prettifier{},
            console_logger(log_level::debug));

        checker.check2(
            [](const std::string& a, const std::string& b) {
                if ((a + b).size() != a.size() + b.size()) {
                    throw std::logic_error("concatenation changed the length");
                }
            },
            string_generator{}, string_generator{},
            {"a", "b"});

        std::cout << "  ✓ Concatenation preserves length\n\n";
        return true;
    } catch (const property_check_failed_exception& e) {
        std::cerr << "  ✗ " << e.what() << "\n\n";
        return false;
    }
}

auto example_discarding_predicate() -> bool {
    std::cout << "Example 2: Discarding with whenever()\n";

    try {
        property_checker<> checker(check_parameters{.min_successful = example_min_successful, .seed = example_seed});

        checker.check1(
            [](std::int32_t n) {
                return whenever(n != 0, [n] { return (n * n) / n == n; });
            },
            int_generator{int_low, int_high},
            {"n"});

        std::cout << "  ✓ n * n / n == n for non-zero n\n\n";
        return true;
    } catch (const property_check_failed_exception& e) {
        std::cerr << "  ✗ " << e.what() << "\n\n";
        return false;
    }
}

auto example_fact_predicate() -> bool {
    std::cout << "Example 3: Fact predicate\n";

    property_checker<> checker(check_parameters{.seed = example_seed});
    auto outcome = checker.check2(
        [](std::int32_t a, std::int32_t b) {
            return fact::expect(a + b == b + a, "addition is not commutative");
        },
        int_generator{int_low, int_high},
        int_generator{int_low, int_high});

    std::cout << "  " << outcome << "\n\n";
    return outcome.is_yes();
}

auto example_falsified_property() -> bool {
    std::cout << "Example 4: Falsified property report\n";

    property_checker<> checker(check_parameters{.seed = example_seed});
    try {
        checker.check1(
            [](std::int32_t n) { return n >= 0; },
            int_generator{int_low, int_high},
            {"n"});
        std::cerr << "  ✗ Expected the property to be falsified\n\n";
        return false;
    } catch (const property_check_failed_exception& e) {
        std::cout << e.what() << "\n\n";
        return true;
    }
}

auto main() -> int {
    std::cout << "Property check examples\n";
    std::cout << std::string(60, '=') << "\n\n";

    int failed = 0;
    if (!example_void_predicate()) failed++;
    if (!example_discarding_predicate()) failed++;
    if (!example_fact_predicate()) failed++;
    if (!example_falsified_property()) failed++;

    std::cout << std::string(60, '=') << "\n";
    if (failed > 0) {
        std::cerr << failed << " example(s) failed\n";
        return 1;
    }

    std::cout << "All examples completed successfully!\n";
    return 0;
}
