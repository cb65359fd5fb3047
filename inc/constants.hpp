#pragma once

#include "real_traits.hpp"
#include "series.hpp"

namespace decmath {

/**
 * @brief π at the precision of T
 *
 * Machin's formula π = 16·atan(1/5) - 4·atan(1/239), summed with the
 * arctangent kernel at elevated precision and rounded once. Computed on first
 * use and cached per type.
 */
template<real_number T>
T pi() {
    static const T value = [] {
        using W = elevated_t<T>;
        const W a = atan_taylor(W{1} / W{5}).value;
        const W b = atan_taylor(W{1} / W{239}).value;
        return narrow<T>(W{16} * a - W{4} * b);
    }();
    return value;
}

template<real_number T>
T half_pi() {
    static const T value = pi<T>() / T{2};
    return value;
}

template<real_number T>
T two_pi() {
    static const T value = pi<T>() * T{2};
    return value;
}

/// Euler's number, exp(1)
template<real_number T>
T e() {
    static const T value = decmath::exp(T{1});
    return value;
}

} // namespace decmath
