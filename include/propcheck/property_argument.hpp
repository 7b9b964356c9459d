#pragma once

#include <propcheck/prettifier.hpp>

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace propcheck {

/**
 * @brief One value fed to the predicate, with its optional parameter label
 *
 * The value is type-erased so that results of different arities share one
 * type; the renderer remembers the concrete type for the prettifier.
 */
class property_argument {
public:
    template<typename T>
    property_argument(std::optional<std::string> label, T value)
        : _label(std::move(label))
        , _value(std::move(value))
        , _render([](const std::any& held, const prettifier& pretty) -> std::string {
              return pretty(std::any_cast<const T&>(held));
          }) {}

    auto label() const -> const std::optional<std::string>& {
        return _label;
    }

    auto value() const -> const std::any& {
        return _value;
    }

    // Throws std::bad_any_cast when T is not the generated type
    template<typename T>
    auto value_as() const -> const T& {
        return std::any_cast<const T&>(_value);
    }

    [[nodiscard]] auto with_label(std::optional<std::string> label) const -> property_argument {
        auto copy = *this;
        copy._label = std::move(label);
        return copy;
    }

    auto render(const prettifier& pretty) const -> std::string {
        return _render(_value, pretty);
    }

private:
    std::optional<std::string> _label;
    std::any _value;
    std::function<std::string(const std::any&, const prettifier&)> _render;
};

} // namespace propcheck
