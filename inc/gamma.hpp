#pragma once

#include "angle.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include "real_traits.hpp"
#include "trig.hpp"

namespace decmath {

namespace detail {

    /**
     * @brief Number of terms a of the Spouge-style sum for a given precision
     *
     * a = ceil(1.25·digits / log10(2π)); the truncation error of the sum then
     * sits well below one unit in the last place.
     */
    constexpr int gamma_terms(int digits) {
        const double a = 1.25 * digits / 0.79817986835811504;   // log10(2π)
        const int    n = static_cast<int>(a);
        return (static_cast<double>(n) < a) ? n + 1 : n;
    }

    /**
     * @brief Round an integer-valued result that has picked up division error
     *
     * Only values that T represents exactly as integers are rounded; anything
     * at or beyond 10^digits is returned unchanged.
     */
    template<real_number T>
    T round_if_exact(const T& r) {
        if (is_special(r)) {
            return r;
        }
        const T limit = decmath::pow(T{10}, real_traits<T>::from_int(real_traits<T>::digits));
        const T a = decmath::abs(r);
        if (!(a < limit)) {
            return r;
        }
        const T n = real_traits<T>::trunc(a + T{1} / T{2});
        return is_negative(r) ? -n : n;
    }

} // namespace detail

/**
 * @brief Gamma function
 *
 * Integers at or above one are computed as the exact product 2·3·…·(t-1).
 * Other arguments below one half go through the reflection formula
 * Γ(t) = π / (sin(πt)·Γ(1-t)). The remaining arguments are evaluated with a
 * Spouge-style sum carried at series_t precision, since the alternating
 * terms cancel about 0.86 of the target digits:
 *
 *     Γ(t) = √(2π)·(t+a-1)^(t-½)·e^-(t+a-1)·(1 + Σₖ cₖ / (t+k-1))
 *     cₖ = (-1)^(k+1)·e^(a-k)·(a-k)^(k-½) / (√(2π)·(k-1)!)      k = 1 … a-1
 *
 * @param t Argument
 *
 * @return Γ(t); NaN at the poles 0, -1, -2, … and for NaN or -∞; +∞ when
 *         |t| > 1e8
 */
template<real_number T>
T gamma(const T& t) {
    using W = series_t<T>;

    if (is_nan(t)) {
        return t;
    }
    if (is_infinite(t) && is_negative(t)) {
        logger()->debug("gamma: argument is -inf");
        return nan<T>();
    }
    if (T{100000000} < decmath::abs(t)) {
        logger()->debug("gamma: argument {} is too large", real_traits<T>::to_string(t));
        return infinity<T>();
    }
    if (is_integer(t) && !(T{0} < t)) {
        logger()->debug("gamma: pole at {}", real_traits<T>::to_string(t));
        return nan<T>();
    }

    const bool reflect = t < T{1} / T{2};
    const W    wt = narrow<W>(t);
    W          arg = wt;
    W          sin_pi_t{};

    if (reflect) {
        arg = W{1} - wt;
        sin_pi_t = decmath::sin(pi<W>() * wt, angle_unit::radians);
        if (is_zero(sin_pi_t)) {
            logger()->debug("gamma: sin(pi*t) vanishes at {}", real_traits<T>::to_string(t));
            return infinity<T>();
        }
    } else if (is_integer(t)) {
        W product{1};
        for (W k{2}; k < wt; k = k + W{1}) {
            product = product * k;
        }
        return narrow<T>(product);
    }

    const int a = detail::gamma_terms(real_traits<T>::digits);
    const W   wa = real_traits<W>::from_int(a);
    const W   half = W{1} / W{2};

    const W root_two_pi = decmath::sqrt(two_pi<W>());
    const W inv_e = W{1} / e<W>();

    W running_exp = decmath::exp(wa);
    W running_factorial{1};
    W sum{1};
    for (int k = 1; k < a; ++k) {
        if (k > 1) {
            running_factorial = running_factorial * real_traits<W>::from_int(k - 1);
        }
        running_exp = running_exp * inv_e;

        const W base = real_traits<W>::from_int(a - k);
        const W exponent = real_traits<W>::from_int(k) - half;
        const W term = running_exp * decmath::pow(base, exponent)
                     / (root_two_pi * running_factorial * (arg + real_traits<W>::from_int(k - 1)));
        sum = (k & 1) ? sum + term : sum - term;
    }

    const W shifted = arg + wa - W{1};
    const W g = root_two_pi * decmath::pow(shifted, arg - half) * decmath::exp(-shifted) * sum;
    if (reflect) {
        return narrow<T>(pi<W>() / (sin_pi_t * g));
    }
    return narrow<T>(g);
}

/// n! = Γ(n + 1)
template<real_number T>
T factorial(const T& n) {
    return decmath::gamma(n + T{1});
}

/**
 * @brief Number of ordered selections, x! / (x - y)!
 *
 * Integer arguments give an integer result whenever T can hold it exactly.
 */
template<real_number T>
T permutation(const T& x, const T& y) {
    const T r = decmath::factorial(x) / decmath::factorial(x - y);
    if (is_integer(x) && is_integer(y)) {
        return detail::round_if_exact(r);
    }
    return r;
}

/**
 * @brief Number of unordered selections, x! / ((x - y)!·y!)
 */
template<real_number T>
T combination(const T& x, const T& y) {
    const T r = decmath::permutation(x, y) / decmath::factorial(y);
    if (is_integer(x) && is_integer(y)) {
        return detail::round_if_exact(r);
    }
    return r;
}

} // namespace decmath
