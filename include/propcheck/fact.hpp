#pragma once

#include <cstdint>
#include <exception>
#include <ostream>
#include <string>
#include <utility>

namespace propcheck {

/**
 * @brief Ternary outcome of a property: Yes, VacuousYes or No
 *
 * A VacuousYes is a Yes whose premise did not hold; the check loop counts
 * it as a discard. A No may carry the exception that produced it.
 */
class fact {
public:
    enum class kind : std::uint8_t {
        yes,
        vacuous_yes,
        no
    };

    static auto yes(std::string message = "Yes") -> fact {
        return fact(kind::yes, std::move(message), nullptr);
    }

    static auto vacuous_yes(std::string message = "Vacuous yes") -> fact {
        return fact(kind::vacuous_yes, std::move(message), nullptr);
    }

    static auto no(std::string message = "No", std::exception_ptr cause = nullptr) -> fact {
        return fact(kind::no, std::move(message), std::move(cause));
    }

    // Yes when condition holds, No with failure_message otherwise
    static auto expect(bool condition, std::string failure_message = "Expectation failed") -> fact {
        if (condition) {
            return yes();
        }
        return no(std::move(failure_message));
    }

    auto get_kind() const -> kind {
        return _kind;
    }

    // True for both Yes and VacuousYes
    auto is_yes() const -> bool {
        return _kind != kind::no;
    }

    auto is_vacuous_yes() const -> bool {
        return _kind == kind::vacuous_yes;
    }

    auto is_no() const -> bool {
        return _kind == kind::no;
    }

    auto message() const -> const std::string& {
        return _message;
    }

    auto cause() const -> std::exception_ptr {
        return _cause;
    }

    // A false premise makes the implication vacuously true
    auto implies(fact consequent) const -> fact {
        if (is_no()) {
            return vacuous_yes(_message);
        }
        return consequent;
    }

    auto operator==(const fact& other) const -> bool {
        return _kind == other._kind && _message == other._message;
    }

private:
    fact(kind k, std::string message, std::exception_ptr cause)
        : _kind(k)
        , _message(std::move(message))
        , _cause(std::move(cause)) {}

    kind _kind;
    std::string _message;
    std::exception_ptr _cause;
};

inline auto operator<<(std::ostream& os, const fact& f) -> std::ostream& {
    switch (f.get_kind()) {
        case fact::kind::yes:
            return os << "Yes(" << f.message() << ")";
        case fact::kind::vacuous_yes:
            return os << "VacuousYes(" << f.message() << ")";
        case fact::kind::no:
            return os << "No(" << f.message() << ")";
    }
    return os;
}

} // namespace propcheck
