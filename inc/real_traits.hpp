#pragma once

#include <cerrno>
#include <charconv>
#include <cmath>
#include <compare>
#include <concepts>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "fmt/core.h"

namespace decmath {

/**
 * @brief Primitive operation set consumed by every function in the library
 * @ingroup real
 *
 * Each model of a real number provides a specialization exposing exactly the
 * primitives the transcendental and special-function layers are allowed to use.
 * Precision is part of the type: `digits` is the number of significant decimal
 * digits carried, and `rebind<D>` names the same family at D digits.
 *
 * @tparam T Value type
 */
template<typename T>
struct real_traits;

/**
 * @brief real_traits for the built-in floating-point types
 *
 * Primitives forward to <cmath>. Precision cannot be elevated, so `rebind`
 * is the identity.
 */
template<std::floating_point T>
struct real_traits<T> {
    static constexpr int digits = std::numeric_limits<T>::digits10;

    template<int D>
    using rebind = T;

    static T from_int(long long v) { return static_cast<T>(v); }
    static T from_uint(unsigned long long v) { return static_cast<T>(v); }
    static long long to_int(const T& x) { return static_cast<long long>(x); }

    static std::optional<T> from_string(std::string_view s) {
        if (s.empty()) {
            return std::nullopt;
        }
        // from_chars rejects a leading '+'
        if (s.front() == '+') {
            s.remove_prefix(1);
            if (s.empty() || s.front() == '-' || s.front() == '+') {
                return std::nullopt;
            }
        }
        T value{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    static std::string to_string(const T& x) { return fmt::format("{}", x); }

    static T sqrt(const T& x) { return std::sqrt(x); }
    static T exp(const T& x) { return std::exp(x); }
    static T ln(const T& x) { return std::log(x); }
    static T log10(const T& x) { return std::log10(x); }
    static T pow(const T& x, const T& y) { return std::pow(x, y); }
    static T hypot(const T& x, const T& y) { return std::hypot(x, y); }
    static T abs(const T& x) { return std::fabs(x); }
    static T trunc(const T& x) { return std::trunc(x); }
    static T remainder(const T& x, const T& y) { return std::fmod(x, y); }

    static std::partial_ordering compare(const T& a, const T& b) { return a <=> b; }

    static bool is_zero(const T& x) { return x == T{0}; }
    static bool is_negative(const T& x) { return std::signbit(x) && !std::isnan(x); }
    static bool is_integer(const T& x) { return std::isfinite(x) && std::trunc(x) == x; }
    static bool is_nan(const T& x) { return std::isnan(x); }
    static bool is_infinite(const T& x) { return std::isinf(x); }
    static bool is_special(const T& x) { return !std::isfinite(x); }

    static T nan() { return std::numeric_limits<T>::quiet_NaN(); }
    static T infinity() { return std::numeric_limits<T>::infinity(); }
    static T epsilon() { return std::numeric_limits<T>::epsilon(); }
};

/**
 * @brief Concept satisfied by every type with a complete real_traits model
 *
 * Checks the arithmetic and comparison operators together with each member of
 * real_traits<T>. All public functions of the library are constrained on it.
 */
template<typename T>
concept real_number = std::regular<T> && requires(const T& a, const T& b, long long i, unsigned long long u, std::string_view s) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
    { -a } -> std::convertible_to<T>;
    { a < b } -> std::convertible_to<bool>;
    { a == b } -> std::convertible_to<bool>;

    { real_traits<T>::digits } -> std::convertible_to<int>;
    { real_traits<T>::from_int(i) } -> std::same_as<T>;
    { real_traits<T>::from_uint(u) } -> std::same_as<T>;
    { real_traits<T>::to_int(a) } -> std::same_as<long long>;
    { real_traits<T>::from_string(s) } -> std::same_as<std::optional<T>>;
    { real_traits<T>::to_string(a) } -> std::same_as<std::string>;

    { real_traits<T>::sqrt(a) } -> std::same_as<T>;
    { real_traits<T>::exp(a) } -> std::same_as<T>;
    { real_traits<T>::ln(a) } -> std::same_as<T>;
    { real_traits<T>::log10(a) } -> std::same_as<T>;
    { real_traits<T>::pow(a, b) } -> std::same_as<T>;
    { real_traits<T>::hypot(a, b) } -> std::same_as<T>;
    { real_traits<T>::abs(a) } -> std::same_as<T>;
    { real_traits<T>::trunc(a) } -> std::same_as<T>;
    { real_traits<T>::remainder(a, b) } -> std::same_as<T>;
    { real_traits<T>::compare(a, b) } -> std::same_as<std::partial_ordering>;

    { real_traits<T>::is_zero(a) } -> std::same_as<bool>;
    { real_traits<T>::is_negative(a) } -> std::same_as<bool>;
    { real_traits<T>::is_integer(a) } -> std::same_as<bool>;
    { real_traits<T>::is_nan(a) } -> std::same_as<bool>;
    { real_traits<T>::is_infinite(a) } -> std::same_as<bool>;
    { real_traits<T>::is_special(a) } -> std::same_as<bool>;

    { real_traits<T>::nan() } -> std::same_as<T>;
    { real_traits<T>::infinity() } -> std::same_as<T>;
    { real_traits<T>::epsilon() } -> std::same_as<T>;
};

/// Same family as T carrying D significant digits
template<real_number T, int D>
using rebind_t = typename real_traits<T>::template rebind<D>;

/// Working type for computations that need half as many digits again as T
template<real_number T>
using elevated_t = rebind_t<T, (real_traits<T>::digits * 3 + 1) / 2 + 2>;

/// Working type of the sine/cosine Taylor engine
template<real_number T>
using series_t = rebind_t<T, real_traits<T>::digits * 2 + 8>;

/**
 * @brief Convert between two models of the same family
 *
 * Narrowing conversions round to the destination precision.
 */
template<real_number To, real_number From>
To narrow(const From& x) {
    if constexpr (std::is_same_v<To, From>) {
        return x;
    } else {
        return static_cast<To>(x);
    }
}

// Thin free-function spellings of the primitives, used throughout the library.

template<real_number T>
T sqr(const T& x) {
    return x * x;
}

template<real_number T>
bool is_nan(const T& x) {
    return real_traits<T>::is_nan(x);
}

template<real_number T>
bool is_infinite(const T& x) {
    return real_traits<T>::is_infinite(x);
}

template<real_number T>
bool is_special(const T& x) {
    return real_traits<T>::is_special(x);
}

template<real_number T>
bool is_zero(const T& x) {
    return real_traits<T>::is_zero(x);
}

template<real_number T>
bool is_negative(const T& x) {
    return real_traits<T>::is_negative(x);
}

template<real_number T>
bool is_integer(const T& x) {
    return real_traits<T>::is_integer(x);
}

template<real_number T>
T abs(const T& x) {
    return real_traits<T>::abs(x);
}

template<real_number T>
T sqrt(const T& x) {
    return real_traits<T>::sqrt(x);
}

template<real_number T>
T exp(const T& x) {
    return real_traits<T>::exp(x);
}

template<real_number T>
T ln(const T& x) {
    return real_traits<T>::ln(x);
}

template<real_number T>
T log10(const T& x) {
    return real_traits<T>::log10(x);
}

template<real_number T>
T pow(const T& x, const T& y) {
    return real_traits<T>::pow(x, y);
}

template<real_number T>
T hypot(const T& x, const T& y) {
    return real_traits<T>::hypot(x, y);
}

/**
 * @brief Cube root preserving the sign of the argument
 */
template<real_number T>
T cbrt(const T& x) {
    if (is_special(x) || is_zero(x)) {
        return x;
    }
    const T third = T{1} / T{3};
    if (is_negative(x)) {
        return -real_traits<T>::pow(-x, third);
    }
    return real_traits<T>::pow(x, third);
}

template<real_number T>
T nan() {
    return real_traits<T>::nan();
}

template<real_number T>
T infinity() {
    return real_traits<T>::infinity();
}

} // namespace decmath
