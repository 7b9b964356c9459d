#pragma once

#include <propcheck/randomizer.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace propcheck {

// Size bounds handed to a generator for one draw
struct size_param {
    std::size_t min_size{0};
    std::size_t size_range{0};
    std::size_t size{0};

    auto max_size() const -> std::size_t {
        return min_size + size_range;
    }

    auto operator==(const size_param&) const -> bool = default;
};

// Number of sizes planned up front, min_size included
inline constexpr std::size_t planned_size_count = 10;

/**
 * @brief Plan the sizes consumed by the first iterations of a check
 *
 * Returns min_size followed by nine draws from [min_size, max_size], sorted
 * ascending, together with the advanced randomizer. The smallest size is
 * always tried first. When the bounds coincide the randomizer is returned
 * unchanged.
 */
inline auto plan_sizes(std::size_t min_size, std::size_t max_size, randomizer rnd)
    -> std::pair<std::vector<std::size_t>, randomizer> {
    std::vector<std::size_t> sizes;
    sizes.reserve(planned_size_count);
    sizes.push_back(min_size);

    for (std::size_t i = 1; i < planned_size_count; ++i) {
        auto [size, next] = rnd.choose_size(min_size, max_size);
        sizes.push_back(size);
        rnd = next;
    }

    std::sort(sizes.begin(), sizes.end());
    return {std::move(sizes), rnd};
}

} // namespace propcheck
