#pragma once

#include <charconv>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace propcheck {

namespace detail {

template<typename T>
concept ostreamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
struct is_tuple_like : std::false_type {};

template<typename A, typename B>
struct is_tuple_like<std::pair<A, B>> : std::true_type {};

template<typename... Ts>
struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};

template<typename T>
concept string_like = std::is_convertible_v<const T&, std::string_view>;

} // namespace detail

/**
 * @brief Renders generated values for failure reports
 *
 * The default rendering quotes strings and characters, prints containers as
 * [a, b], pairs and tuples as (a, b), optionals as Some(x) / None, and falls
 * back to operator<< where one exists. Per-type overrides added with
 * with_renderer() take precedence everywhere, including inside containers.
 * A prettifier is immutable; with_renderer() returns a new one.
 */
class prettifier {
public:
    using renderer = std::function<std::string(const void*)>;

    prettifier() : _overrides(std::make_shared<override_map>()) {}

    template<typename T, typename F>
    requires std::is_invocable_r_v<std::string, F, const T&>
    [[nodiscard]] auto with_renderer(F&& render) const -> prettifier {
        auto overrides = std::make_shared<override_map>(*_overrides);
        (*overrides)[std::type_index(typeid(T))] =
            [render = std::forward<F>(render)](const void* value) -> std::string {
                return render(*static_cast<const T*>(value));
            };
        return prettifier(std::move(overrides));
    }

    template<typename T>
    auto operator()(const T& value) const -> std::string {
        if (auto it = _overrides->find(std::type_index(typeid(T))); it != _overrides->end()) {
            return it->second(static_cast<const void*>(&value));
        }
        return render_default(value);
    }

private:
    using override_map = std::unordered_map<std::type_index, renderer>;

    explicit prettifier(std::shared_ptr<override_map> overrides)
        : _overrides(std::move(overrides)) {}

    template<typename T>
    auto render_default(const T& value) const -> std::string {
        if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, char>) {
            return std::string("'") + value + "'";
        } else if constexpr (detail::string_like<T>) {
            return "\"" + std::string(std::string_view(value)) + "\"";
        } else if constexpr (std::is_integral_v<T>) {
            return std::to_string(value);
        } else if constexpr (std::is_floating_point_v<T>) {
            char buffer[64];
            auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
            if (ec != std::errc()) {
                std::ostringstream oss;
                oss << value;
                return oss.str();
            }
            return std::string(buffer, ptr);
        } else if constexpr (std::is_enum_v<T>) {
            return (*this)(static_cast<std::underlying_type_t<T>>(value));
        } else if constexpr (detail::is_optional<T>::value) {
            if (!value.has_value()) {
                return "None";
            }
            return "Some(" + (*this)(*value) + ")";
        } else if constexpr (detail::is_tuple_like<T>::value) {
            std::string result = "(";
            std::apply([&](const auto&... elements) {
                std::size_t index = 0;
                ((result += (index++ == 0 ? "" : ", ") + (*this)(elements)), ...);
            }, value);
            return result + ")";
        } else if constexpr (std::ranges::input_range<const T>) {
            std::string result = "[";
            bool first = true;
            for (const auto& element : value) {
                if (!first) {
                    result += ", ";
                }
                first = false;
                result += (*this)(element);
            }
            return result + "]";
        } else if constexpr (detail::ostreamable<T>) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        } else {
            return std::string("<unprintable ") + typeid(T).name() + ">";
        }
    }

    std::shared_ptr<const override_map> _overrides;
};

} // namespace propcheck
