#pragma once

#include <propcheck/exceptions.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace propcheck {

// Parameters of one property check
struct check_parameters {
    std::size_t min_successful{10};
    double max_discarded_factor{5.0};
    std::size_t min_size{0};
    std::size_t size_range{100};
    // Overrides the process-wide default seed when set
    std::optional<std::int64_t> seed{};

    auto max_size() const -> std::size_t {
        return min_size + size_range;
    }

    // ceil(min_successful * max_discarded_factor), never below 1
    auto max_discarded() const -> std::size_t {
        auto raw = std::ceil(static_cast<double>(min_successful) * max_discarded_factor);
        if (!(raw >= 1.0)) {
            return 1;
        }
        if (raw >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
            return std::numeric_limits<std::size_t>::max();
        }
        return static_cast<std::size_t>(raw);
    }

    // Edge cases each generator contributes before the first iteration
    auto max_edges() const -> std::size_t {
        return min_successful / 5;
    }

    auto is_valid() const -> bool {
        return min_successful > 0 &&
               std::isfinite(max_discarded_factor) &&
               max_discarded_factor > 0.0 &&
               size_range <= std::numeric_limits<std::size_t>::max() - min_size;
    }
};

inline auto validate_parameters(const check_parameters& params) -> void {
    if (params.min_successful == 0) {
        throw configuration_exception("min_successful must be greater than 0");
    }

    if (!std::isfinite(params.max_discarded_factor)) {
        throw configuration_exception("max_discarded_factor must be finite");
    }

    if (params.max_discarded_factor <= 0.0) {
        throw configuration_exception("max_discarded_factor must be positive");
    }

    // max_size = min_size + size_range must be representable
    if (params.size_range > std::numeric_limits<std::size_t>::max() - params.min_size) {
        throw configuration_exception(
            "min_size + size_range overflows: min_size=" + std::to_string(params.min_size) +
            ", size_range=" + std::to_string(params.size_range));
    }
}

} // namespace propcheck
