// Example: Deferred Property Checks
// This example demonstrates:
// 1. Predicates returning propcheck::Future, checked one evaluation at a time
// 2. Running continuations on a folly thread pool with check_async_via
// 3. Failure reporting from inside the returned future

#include <propcheck/propcheck.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/init/Init.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace propcheck;

namespace {
    constexpr std::size_t pool_threads = 4;
    constexpr std::size_t example_min_successful = 20;
    constexpr std::int64_t example_seed = 7;
    constexpr auto simulated_latency = std::chrono::milliseconds{1};
}

// Uniform integers in [0, bound] without edge cases
struct bounded_generator {
    using value_type = std::int32_t;

    std::int32_t bound;

    auto init_edges([[maybe_unused]] std::size_t max_count, randomizer rnd) const
        -> std::pair<std::vector<std::int32_t>, randomizer> {
        return {{}, rnd};
    }

    auto next([[maybe_unused]] size_param size, std::vector<std::int32_t> edges, randomizer rnd) const
        -> generated<std::int32_t> {
        auto [value, next_rnd] = rnd.choose_int(0, bound);
        return {value, std::move(edges), next_rnd};
    }
};

// Stand-in for a remote service that squares its input
auto remote_square(folly::Executor* executor, std::int32_t value) -> Future<std::int64_t> {
    return FutureFactory::makeFuture().via(executor).thenValue([value]() {
        std::this_thread::sleep_for(simulated_latency);
        return static_cast<std::int64_t>(value) * value;
    });
}

auto example_async_success(folly::Executor* executor) -> bool {
    std::cout << "Example 1: Deferred predicate on a thread pool\n";

    property_checker<console_logger> checker(
        check_parameters{.min_successful = example_min_successful, .seed = example_seed},
        prettifier{},
        console_logger(log_level::debug));
    std::atomic<int> in_flight{0};
    std::atomic<bool> overlapped{false};

    auto pending = checker.check_async_via(
        executor, {"n"}, std::nullopt, std::source_location::current(),
        [executor, &in_flight, &overlapped](std::int32_t n) {
            if (++in_flight > 1) {
                overlapped = true;
            }
            return remote_square(executor, n).thenValue([n, &in_flight](std::int64_t squared) {
                --in_flight;
                return fact::expect(squared >= n, "square smaller than input");
            });
        },
        bounded_generator{1000});

    auto outcome = pending.get();
    std::cout << "  " << outcome << "\n";
    std::cout << "  evaluations overlapped: " << (overlapped ? "yes" : "no") << "\n\n";
    return outcome.is_yes() && !overlapped;
}

auto example_async_failure(folly::Executor* executor) -> bool {
    std::cout << "Example 2: Falsified deferred predicate\n";

    property_checker<> checker(check_parameters{.seed = example_seed});
    auto pending = checker.check1(
        [executor](std::int32_t n) {
            return remote_square(executor, n).thenValue([](std::int64_t squared) {
                return squared <= 10000;
            });
        },
        bounded_generator{1000},
        {"n"});

    auto outcome = pending.getTry();
    if (!outcome.hasException()) {
        std::cerr << "  ✗ Expected the property to be falsified\n\n";
        return false;
    }

    try {
        std::rethrow_exception(outcome.exception());
    } catch (const property_check_failed_exception& e) {
        std::cout << e.what() << "\n\n";
        return true;
    }
}

auto main(int argc, char** argv) -> int {
    folly::Init init(&argc, &argv);
    folly::CPUThreadPoolExecutor executor(pool_threads);

    std::cout << "Deferred property check examples\n";
    std::cout << std::string(60, '=') << "\n\n";

    int failed = 0;
    if (!example_async_success(&executor)) failed++;
    if (!example_async_failure(&executor)) failed++;

    std::cout << std::string(60, '=') << "\n";
    if (failed > 0) {
        std::cerr << failed << " example(s) failed\n";
        return 1;
    }

    std::cout << "All examples completed successfully!\n";
    return 0;
}
