#pragma once

#include "real_traits.hpp"

namespace decmath {

/// Safety valve shared by every iterative kernel
inline constexpr int max_series_terms = 1000;

/**
 * @brief Value produced by a convergence-driven kernel
 *
 * `converged` is false when the iteration cap was reached before the stopping
 * rule fired; `value` then holds the last partial result.
 */
template<real_number T>
struct series_result {
    T    value{};
    bool converged = false;
};

/**
 * @brief Sine and cosine of the same argument
 *
 * Both sums share the running term, so the kernel always produces both.
 */
template<real_number T>
struct sin_cos_result {
    T    sin{};
    T    cos{};
    bool converged = false;
};

/**
 * @brief Taylor expansion of sin(x) and cos(x)
 *
 * Sums cos(x) = 1 - x²/2! + x⁴/4! - ... and sin(x)/x = 1 - x²/3! + x⁴/5! - ...
 * with one running term t = x^2k/(2k)! advanced by one divisor for each sum.
 * A sum stops being updated the first time adding its next term leaves it
 * unchanged; the loop ends when both sums have settled.
 *
 * @tparam T Working type, normally series_t of the caller's type
 * @param x  Angle in radians, already reduced to [0, 2π)
 *
 * @return sin(x), cos(x) and whether both sums settled within the cap
 */
template<real_number T>
sin_cos_result<T> sin_cos_taylor(const T& x) {
    const T x2 = x * x;
    T       j{1};
    T       t{1};
    T       s{1};
    T       c{1};

    bool sin_done = false;
    bool cos_done = false;
    for (int i = 1; i < max_series_terms && !(sin_done && cos_done); ++i) {
        const bool odd = (i & 1) != 0;

        j = j + T{1};
        t = t * (x2 / j);
        if (!cos_done) {
            const T last = c;
            c = odd ? c - t : c + t;
            cos_done = c == last;
        }

        j = j + T{1};
        t = t / j;
        if (!sin_done) {
            const T last = s;
            s = odd ? s - t : s + t;
            sin_done = s == last;
        }
    }

    return {s * x, c, sin_done && cos_done};
}

/**
 * @brief Arctangent of a non-negative argument no greater than one
 *
 * Halves the angle with tan(θ/2) = a / (1 + sqrt(1 + a²)) until a ≤ 0.1, sums
 * a·(1 - a²/3 + a⁴/5 - ...) two terms at a time until two consecutive partial
 * sums compare equal, then doubles the result once per halving.
 *
 * @param a Argument in [0, 1]
 *
 * @return atan(a) and whether the sum settled within the cap
 */
template<real_number T>
series_result<T> atan_taylor(T a) {
    const T limit = T{1} / T{10};

    int doublings = 0;
    for (int i = 0; i < max_series_terms && limit < a; ++i) {
        a = a / (T{1} + decmath::sqrt(T{1} + a * a));
        ++doublings;
    }

    const T a2 = a * a;
    T       t = a2;
    T       j{5};
    T       sum = T{1} - t / T{3};

    bool converged = false;
    for (int i = 0; i < max_series_terms; ++i) {
        const T last = sum;

        t = t * a2;
        sum = sum + t / j;
        j = j + T{2};

        t = t * a2;
        sum = sum - t / j;
        j = j + T{2};

        if (sum == last) {
            converged = true;
            break;
        }
    }

    T result = sum * a;
    for (; doublings > 0; --doublings) {
        result = result + result;
    }
    return {result, converged};
}

} // namespace decmath
