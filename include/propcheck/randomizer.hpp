#pragma once

#include <propcheck/exceptions.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace propcheck {

// Environment variable that pins the process-wide default seed
inline constexpr const char* seed_environment_variable = "PROPCHECK_SEED";

/**
 * @brief Immutable 48-bit linear congruential random source
 *
 * Every draw returns the value together with the successor randomizer;
 * the receiver is never modified. Two randomizers built from the same seed
 * produce the same sequence.
 */
class randomizer {
public:
    static constexpr std::uint64_t multiplier = 0x5DEECE66DULL;
    static constexpr std::uint64_t addend = 0xBULL;
    static constexpr std::uint64_t mask = (1ULL << 48) - 1;

    explicit randomizer(std::int64_t seed)
        : _seed(seed)
        , _state((static_cast<std::uint64_t>(seed) ^ multiplier) & mask) {}

    [[nodiscard]] auto next_int() const -> std::pair<std::int32_t, randomizer> {
        auto [bits, next] = next_bits(32);
        return {static_cast<std::int32_t>(bits), next};
    }

    [[nodiscard]] auto next_long() const -> std::pair<std::int64_t, randomizer> {
        auto [high, r1] = next_bits(32);
        auto [low, r2] = r1.next_bits(32);
        auto value = (static_cast<std::uint64_t>(high) << 32) + static_cast<std::uint64_t>(static_cast<std::int32_t>(low));
        return {static_cast<std::int64_t>(value), r2};
    }

    // Uniform in [0, 1)
    [[nodiscard]] auto next_double() const -> std::pair<double, randomizer> {
        auto [high, r1] = next_bits(26);
        auto [low, r2] = r1.next_bits(27);
        auto combined = (static_cast<std::uint64_t>(high) << 27) + low;
        return {static_cast<double>(combined) * 0x1.0p-53, r2};
    }

    // Inclusive on both ends; bounds may be given in either order
    [[nodiscard]] auto choose_int(std::int32_t from, std::int32_t to) const -> std::pair<std::int32_t, randomizer> {
        if (from == to) {
            return {from, *this};
        }
        auto lo = std::min(from, to);
        auto hi = std::max(from, to);
        auto range = static_cast<std::uint64_t>(static_cast<std::int64_t>(hi) - lo) + 1;
        auto [raw, next] = next_long();
        auto offset = static_cast<std::uint64_t>(raw) % range;
        return {static_cast<std::int32_t>(lo + static_cast<std::int64_t>(offset)), next};
    }

    // Inclusive on both ends; returns *this unchanged when from == to
    [[nodiscard]] auto choose_size(std::size_t from, std::size_t to) const -> std::pair<std::size_t, randomizer> {
        if (from == to) {
            return {from, *this};
        }
        auto lo = std::min(from, to);
        auto hi = std::max(from, to);
        auto [raw, next] = next_long();
        auto span = static_cast<std::uint64_t>(hi - lo);
        if (span == UINT64_MAX) {
            return {static_cast<std::size_t>(raw), next};
        }
        auto offset = static_cast<std::uint64_t>(raw) % (span + 1);
        return {lo + static_cast<std::size_t>(offset), next};
    }

    // The seed this sequence was started from
    [[nodiscard]] auto seed() const -> std::int64_t {
        return _seed;
    }

    auto operator==(const randomizer& other) const -> bool {
        return _state == other._state;
    }

private:
    randomizer(std::int64_t seed, std::uint64_t state)
        : _seed(seed)
        , _state(state) {}

    [[nodiscard]] auto next_bits(int bits) const -> std::pair<std::uint32_t, randomizer> {
        auto next_state = (_state * multiplier + addend) & mask;
        auto value = static_cast<std::uint32_t>(next_state >> (48 - bits));
        return {value, randomizer(_seed, next_state)};
    }

    std::int64_t _seed;
    std::uint64_t _state;
};

namespace detail {

inline auto parse_seed(std::string_view text) -> std::int64_t {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        throw configuration_exception(
            std::string(seed_environment_variable) + " is not a valid 64-bit integer: '" +
            std::string(text) + "'");
    }
    return value;
}

inline auto read_default_seed() -> std::int64_t {
    if (const char* env = std::getenv(seed_environment_variable); env != nullptr) {
        return parse_seed(env);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace detail

// Process-wide fallback seed, read once on first use and never changed
inline auto default_seed() -> std::int64_t {
    static const std::int64_t seed = detail::read_default_seed();
    return seed;
}

inline auto default_randomizer() -> randomizer {
    return randomizer(default_seed());
}

} // namespace propcheck
