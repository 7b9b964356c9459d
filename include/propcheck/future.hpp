#pragma once

#include <chrono>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <folly/Executor.h>
#include <folly/ExceptionWrapper.h>
#include <folly/Try.h>
#include <folly/Unit.h>
#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>

#include "../concepts/future.hpp"

namespace propcheck {

template<typename T> class Try;
template<typename T> class Future;
template<typename T> class Promise;

namespace detail {

inline auto to_std_exception_ptr(const folly::exception_wrapper& ew) -> std::exception_ptr {
    if (ew) {
        return ew.to_exception_ptr();
    }
    return nullptr;
}

inline auto to_folly_exception_wrapper(std::exception_ptr ep) -> folly::exception_wrapper {
    if (ep) {
        return folly::exception_wrapper(ep);
    }
    return folly::exception_wrapper();
}

// folly has no Future<void>; the wrappers map void onto folly::Unit
template<typename T>
struct void_to_unit {
    using type = T;
};

template<>
struct void_to_unit<void> {
    using type = folly::Unit;
};

template<typename T>
using void_to_unit_t = typename void_to_unit<T>::type;

template<typename T>
struct is_future : std::false_type {};

template<typename T>
struct is_future<Future<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_future_v = is_future<std::remove_cvref_t<T>>::value;

// Lifts the result of a continuation into something folly can chain on.
// Wrapper futures are unwrapped so folly flattens them; void becomes Unit.
template<typename F, typename... Args>
auto invoke_for_folly(F& func, Args&&... args) {
    using ReturnType = std::invoke_result_t<F&, Args...>;
    if constexpr (is_future_v<ReturnType>) {
        return func(std::forward<Args>(args)...).get_folly_future();
    } else if constexpr (std::is_void_v<ReturnType>) {
        func(std::forward<Args>(args)...);
        return folly::Unit{};
    } else {
        return func(std::forward<Args>(args)...);
    }
}

template<typename R>
struct continuation_value {
    using type = R;
};

template<typename U>
struct continuation_value<Future<U>> {
    using type = U;
};

template<typename R>
using continuation_value_t = typename continuation_value<std::remove_cvref_t<R>>::type;

} // namespace detail

//=============================================================================
// Try
//=============================================================================

/**
 * @brief Value-or-exception holder over folly::Try
 *
 * Handed to thenTry() continuations so that normal and exceptional
 * completions of a predicate reach the same code path.
 *
 * @tparam T The value type (can be void)
 */
template<typename T>
class Try {
public:
    using value_type = T;
    using folly_type = folly::Try<T>;

    Try() = default;
    explicit Try(folly_type ft) : _folly_try(std::move(ft)) {}

    template<typename U = T>
    requires(!std::is_same_v<std::remove_cvref_t<U>, folly_type> &&
             !std::is_same_v<std::remove_cvref_t<U>, folly::exception_wrapper> &&
             !std::is_same_v<std::remove_cvref_t<U>, std::exception_ptr> &&
             std::is_constructible_v<T, U&&>)
    explicit Try(U&& value) : _folly_try(T(std::forward<U>(value))) {}

    explicit Try(folly::exception_wrapper ex) : _folly_try(std::move(ex)) {}
    explicit Try(std::exception_ptr ex) : _folly_try(detail::to_folly_exception_wrapper(ex)) {}

    // Throws the held exception if there is no value
    auto value() -> T& {
        return _folly_try.value();
    }

    auto value() const -> const T& {
        return _folly_try.value();
    }

    auto exception() const -> std::exception_ptr {
        if (_folly_try.hasException()) {
            return detail::to_std_exception_ptr(_folly_try.exception());
        }
        return nullptr;
    }

    auto hasValue() const -> bool {
        return _folly_try.hasValue();
    }

    auto hasException() const -> bool {
        return _folly_try.hasException();
    }

    // Exact-type test on the held exception, no rethrow involved
    template<typename E>
    auto holds_exception() const -> bool {
        return _folly_try.hasException() && _folly_try.exception().template is_compatible_with<E>();
    }

private:
    folly_type _folly_try;
};

template<>
class Try<void> {
public:
    using value_type = void;
    using folly_type = folly::Try<folly::Unit>;

    Try() : _folly_try(folly::Unit{}) {}
    explicit Try(folly_type ft) : _folly_try(std::move(ft)) {}
    explicit Try(folly::exception_wrapper ex) : _folly_try(std::move(ex)) {}
    explicit Try(std::exception_ptr ex) : _folly_try(detail::to_folly_exception_wrapper(ex)) {}

    // Rethrows the held exception, if any
    auto value() const -> void {
        static_cast<void>(_folly_try.value());
    }

    auto exception() const -> std::exception_ptr {
        if (_folly_try.hasException()) {
            return detail::to_std_exception_ptr(_folly_try.exception());
        }
        return nullptr;
    }

    auto hasValue() const -> bool {
        return _folly_try.hasValue();
    }

    auto hasException() const -> bool {
        return _folly_try.hasException();
    }

    template<typename E>
    auto holds_exception() const -> bool {
        return _folly_try.hasException() && _folly_try.exception().template is_compatible_with<E>();
    }

private:
    folly_type _folly_try;
};

//=============================================================================
// Future
//=============================================================================

/**
 * @brief Future wrapper over folly::Future
 *
 * The deferred property check chains one predicate evaluation after another
 * through thenTry(); nothing in the library blocks on a Future except get()
 * and getTry(), which are meant for callers and tests.
 *
 * @tparam T The value type (can be void)
 */
template<typename T>
class Future {
public:
    using value_type = T;
    using folly_value_type = detail::void_to_unit_t<T>;
    using folly_type = folly::Future<folly_value_type>;

    Future() requires(std::is_void_v<T>) : _folly_future(folly::makeFuture(folly::Unit{})) {}
    explicit Future(folly_type ff) : _folly_future(std::move(ff)) {}

    template<typename U>
    requires(!std::is_void_v<T> &&
             !std::is_same_v<std::remove_cvref_t<U>, folly_type> &&
             !std::is_same_v<std::remove_cvref_t<U>, Future> &&
             !std::is_same_v<std::remove_cvref_t<U>, folly::exception_wrapper> &&
             !std::is_same_v<std::remove_cvref_t<U>, std::exception_ptr>)
    explicit Future(U&& value)
        : _folly_future(folly::makeFuture<folly_value_type>(folly_value_type(std::forward<U>(value)))) {}

    explicit Future(folly::exception_wrapper ex)
        : _folly_future(folly::makeFuture<folly_value_type>(std::move(ex))) {}

    explicit Future(std::exception_ptr ex)
        : _folly_future(folly::makeFuture<folly_value_type>(detail::to_folly_exception_wrapper(ex))) {}

    Future(Future&&) = default;
    Future& operator=(Future&&) = default;
    Future(const Future&) = delete;
    Future& operator=(const Future&) = delete;

    // Blocks until ready; rethrows on exceptional completion
    auto get() -> T {
        if constexpr (std::is_void_v<T>) {
            std::move(_folly_future).get();
        } else {
            return std::move(_folly_future).get();
        }
    }

    // Blocks until ready; never throws the held exception
    auto getTry() -> Try<T> {
        _folly_future.wait();
        return Try<T>(std::move(_folly_future.result()));
    }

    template<typename F>
    auto thenValue(F&& func) {
        if constexpr (std::is_void_v<T>) {
            using ReturnType = std::invoke_result_t<F>;
            using NextType = detail::continuation_value_t<ReturnType>;
            return Future<NextType>(std::move(_folly_future).thenValue(
                [func = std::forward<F>(func)](folly::Unit) mutable {
                    return detail::invoke_for_folly(func);
                }));
        } else {
            using ReturnType = std::invoke_result_t<F, T>;
            using NextType = detail::continuation_value_t<ReturnType>;
            return Future<NextType>(std::move(_folly_future).thenValue(
                [func = std::forward<F>(func)](T value) mutable {
                    return detail::invoke_for_folly(func, std::move(value));
                }));
        }
    }

    // Runs on both value and exception; func receives a propcheck::Try<T>
    template<typename F>
    auto thenTry(F&& func) {
        using ReturnType = std::invoke_result_t<F, Try<T>>;
        using NextType = detail::continuation_value_t<ReturnType>;
        return Future<NextType>(std::move(_folly_future).thenTry(
            [func = std::forward<F>(func)](folly::Try<folly_value_type> result) mutable {
                return detail::invoke_for_folly(func, Try<T>(std::move(result)));
            }));
    }

    auto via(folly::Executor* executor) -> Future<T> {
        if (executor == nullptr) {
            throw std::invalid_argument("Executor cannot be null");
        }
        return Future<T>(std::move(_folly_future).via(executor));
    }

    auto isReady() const -> bool {
        return _folly_future.isReady();
    }

    auto wait(std::chrono::milliseconds timeout) -> bool {
        _folly_future.wait(timeout);
        return _folly_future.isReady();
    }

    auto get_folly_future() && -> folly_type {
        return std::move(_folly_future);
    }

private:
    folly_type _folly_future;
};

//=============================================================================
// Promise
//=============================================================================

template<typename T>
class Promise {
public:
    using value_type = T;
    using folly_type = folly::Promise<detail::void_to_unit_t<T>>;

    Promise() = default;

    Promise(Promise&&) = default;
    Promise& operator=(Promise&&) = default;
    Promise(const Promise&) = delete;
    Promise& operator=(const Promise&) = delete;

    template<typename U = T>
    requires(!std::is_void_v<T>)
    auto setValue(U&& value) -> void {
        _folly_promise.setValue(std::forward<U>(value));
    }

    auto setValue() -> void requires(std::is_void_v<T>) {
        _folly_promise.setValue(folly::Unit{});
    }

    auto setException(folly::exception_wrapper ex) -> void {
        if (!ex) {
            throw std::invalid_argument("Exception wrapper cannot be empty");
        }
        _folly_promise.setException(std::move(ex));
    }

    auto setException(std::exception_ptr ex) -> void {
        if (!ex) {
            throw std::invalid_argument("Exception pointer cannot be null");
        }
        _folly_promise.setException(detail::to_folly_exception_wrapper(ex));
    }

    auto isFulfilled() const -> bool {
        return _folly_promise.isFulfilled();
    }

    auto getFuture() -> Future<T> {
        return Future<T>(_folly_promise.getFuture());
    }

private:
    folly_type _folly_promise;
};

//=============================================================================
// FutureFactory
//=============================================================================

class FutureFactory {
public:
    FutureFactory() = delete;

    template<typename T>
    static auto makeFuture(T&& value) -> Future<std::decay_t<T>> {
        return Future<std::decay_t<T>>(folly::makeFuture(std::forward<T>(value)));
    }

    static auto makeFuture() -> Future<void> {
        return Future<void>(folly::makeFuture(folly::Unit{}));
    }

    template<typename T>
    static auto makeExceptionalFuture(folly::exception_wrapper ex) -> Future<T> {
        return Future<T>(folly::makeFuture<detail::void_to_unit_t<T>>(std::move(ex)));
    }

    template<typename T>
    static auto makeExceptionalFuture(std::exception_ptr ex) -> Future<T> {
        return makeExceptionalFuture<T>(detail::to_folly_exception_wrapper(ex));
    }
};

} // namespace propcheck

static_assert(propcheck::try_type<propcheck::Try<int>, int>,
              "propcheck::Try<int> must satisfy try_type concept");
static_assert(propcheck::try_type<propcheck::Try<void>, void>,
              "propcheck::Try<void> must satisfy try_type concept");
static_assert(propcheck::future<propcheck::Future<int>, int>,
              "propcheck::Future<int> must satisfy future concept");
static_assert(propcheck::future<propcheck::Future<void>, void>,
              "propcheck::Future<void> must satisfy future concept");
static_assert(propcheck::promise<propcheck::Promise<int>, int>,
              "propcheck::Promise<int> must satisfy promise concept");
static_assert(propcheck::promise<propcheck::Promise<void>, void>,
              "propcheck::Promise<void> must satisfy promise concept");
