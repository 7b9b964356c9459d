#pragma once

#include <propcheck/generator.hpp>
#include <propcheck/randomizer.hpp>
#include <propcheck/size.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace test_utilities {

/**
 * Generator that always yields the same value and contributes no edge cases
 */
template<typename T>
struct constant_generator {
    using value_type = T;

    T value;

    auto init_edges([[maybe_unused]] std::size_t max_count, propcheck::randomizer rnd) const
        -> std::pair<std::vector<T>, propcheck::randomizer> {
        return {{}, rnd};
    }

    auto next([[maybe_unused]] propcheck::size_param size, std::vector<T> edges, propcheck::randomizer rnd) const
        -> propcheck::generated<T> {
        return {value, std::move(edges), rnd};
    }
};

/**
 * Integers in [low, high]; low and high are the edge cases, drawn first
 */
struct int_range_generator {
    using value_type = std::int32_t;

    std::int32_t low;
    std::int32_t high;

    auto init_edges(std::size_t max_count, propcheck::randomizer rnd) const
        -> std::pair<std::vector<std::int32_t>, propcheck::randomizer> {
        std::vector<std::int32_t> edges{low, high};
        if (low == high) {
            edges.pop_back();
        }
        edges.resize(std::min(max_count, edges.size()));
        return {std::move(edges), rnd};
    }

    auto next([[maybe_unused]] propcheck::size_param size, std::vector<std::int32_t> edges, propcheck::randomizer rnd) const
        -> propcheck::generated<std::int32_t> {
        if (!edges.empty()) {
            auto value = edges.front();
            edges.erase(edges.begin());
            return {value, std::move(edges), rnd};
        }
        auto [value, next_rnd] = rnd.choose_int(low, high);
        return {value, std::move(edges), next_rnd};
    }
};

/**
 * Yields values from a fixed list in order, wrapping around at the end.
 * Copies share the position so a generator handed to a check by reference
 * or by value behaves the same.
 */
template<typename T>
struct sequence_generator {
    using value_type = T;

    std::vector<T> values;
    std::shared_ptr<std::size_t> position = std::make_shared<std::size_t>(0);

    auto init_edges([[maybe_unused]] std::size_t max_count, propcheck::randomizer rnd) const
        -> std::pair<std::vector<T>, propcheck::randomizer> {
        return {{}, rnd};
    }

    auto next([[maybe_unused]] propcheck::size_param size, std::vector<T> edges, propcheck::randomizer rnd) const
        -> propcheck::generated<T> {
        auto value = values[*position % values.size()];
        ++*position;
        return {value, std::move(edges), rnd};
    }
};

/**
 * Records every size_param and edge budget it is handed; yields the size itself
 */
struct size_recording_generator {
    using value_type = std::size_t;

    std::shared_ptr<std::vector<propcheck::size_param>> sizes =
        std::make_shared<std::vector<propcheck::size_param>>();
    std::shared_ptr<std::vector<std::size_t>> edge_budgets =
        std::make_shared<std::vector<std::size_t>>();

    auto init_edges(std::size_t max_count, propcheck::randomizer rnd) const
        -> std::pair<std::vector<std::size_t>, propcheck::randomizer> {
        edge_budgets->push_back(max_count);
        return {{}, rnd};
    }

    auto next(propcheck::size_param size, std::vector<std::size_t> edges, propcheck::randomizer rnd) const
        -> propcheck::generated<std::size_t> {
        sizes->push_back(size);
        return {size.size, std::move(edges), rnd};
    }
};

/**
 * Appends its name to a shared journal on every call, to observe call order
 */
struct journal_generator {
    using value_type = std::string;

    std::string name;
    std::shared_ptr<std::vector<std::string>> journal;

    auto init_edges([[maybe_unused]] std::size_t max_count, propcheck::randomizer rnd) const
        -> std::pair<std::vector<std::string>, propcheck::randomizer> {
        journal->push_back("init:" + name);
        return {{}, rnd};
    }

    auto next([[maybe_unused]] propcheck::size_param size, std::vector<std::string> edges, propcheck::randomizer rnd) const
        -> propcheck::generated<std::string> {
        journal->push_back("next:" + name);
        return {name, std::move(edges), rnd};
    }
};

static_assert(propcheck::generator<constant_generator<int>>);
static_assert(propcheck::generator<int_range_generator>);
static_assert(propcheck::generator<sequence_generator<int>>);
static_assert(propcheck::generator<size_recording_generator>);
static_assert(propcheck::generator<journal_generator>);

} // namespace test_utilities
