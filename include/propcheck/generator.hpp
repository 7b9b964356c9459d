#pragma once

#include <propcheck/randomizer.hpp>
#include <propcheck/size.hpp>

#include <concepts>
#include <cstddef>
#include <utility>
#include <vector>

namespace propcheck {

// One generated value plus the state to thread into the next draw
template<typename T>
struct generated {
    T value;
    std::vector<T> edges;
    randomizer rnd;
};

/**
 * @brief Capability the check loop consumes to produce argument values
 *
 * init_edges() is called once per check with the edge-case budget; the pool
 * it returns is handed back to next() on every draw, which consumes it front
 * first before falling back to random values.
 */
template<typename G>
concept generator = requires(
    const G gen,
    std::size_t max_count,
    randomizer rnd,
    size_param size,
    std::vector<typename G::value_type> edges
) {
    typename G::value_type;
    requires std::copyable<typename G::value_type>;

    { gen.init_edges(max_count, rnd) }
        -> std::same_as<std::pair<std::vector<typename G::value_type>, randomizer>>;
    { gen.next(size, std::move(edges), rnd) }
        -> std::same_as<generated<typename G::value_type>>;
};

template<generator G>
using generator_value_t = typename G::value_type;

} // namespace propcheck
