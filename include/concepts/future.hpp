#pragma once

#include <chrono>
#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include <folly/ExceptionWrapper.h>
#include <folly/Unit.h>

namespace propcheck {

// Concept for Try types (matches folly::Try interface)
template<typename T, typename ValueType>
concept try_type = requires(T t, const T ct) {
    { t.hasValue() } -> std::convertible_to<bool>;
    { t.hasException() } -> std::convertible_to<bool>;
    { t.exception() };
} && (
    // void tries carry no value()
    std::is_void_v<ValueType> || requires(T t, const T ct) {
        { t.value() } -> std::same_as<ValueType&>;
        { ct.value() } -> std::same_as<const ValueType&>;
    }
);

// Concept for Future types that a deferred property predicate may return
template<typename F, typename T>
concept future = requires(F f, const F cf) {
    { cf.isReady() } -> std::convertible_to<bool>;
    { f.wait(std::chrono::milliseconds{}) } -> std::convertible_to<bool>;
    { std::move(f).getTry() };
} && (
    (std::is_void_v<T> && requires(F f2) {
        { std::move(f2).thenValue(std::declval<std::function<void()>>()) };
    }) ||
    (!std::is_void_v<T> && requires(F f2) {
        { std::move(f2).thenValue(std::declval<std::function<void(T)>>()) };
    })
);

// Concept for Promise types (matches folly::Promise interface)
template<typename P, typename T>
concept promise = requires(P p, const P cp) {
    { cp.isFulfilled() } -> std::convertible_to<bool>;
    { p.setException(std::declval<folly::exception_wrapper>()) } -> std::same_as<void>;
    { p.getFuture() };
} && (
    (std::is_void_v<T> && requires(P p) {
        { p.setValue() } -> std::same_as<void>;
    }) ||
    (!std::is_void_v<T> && requires(P p) {
        { p.setValue(std::declval<T>()) } -> std::same_as<void>;
    })
);

} // namespace propcheck
