#pragma once

#include <optional>

#include "real_traits.hpp"

namespace decmath {

namespace detail {

    /**
     * @brief e^|x| / 2 for |x| past which e^-|x| no longer reaches the last digit
     *
     * Formed as e^(|x| - ln 2) so the result stays finite wherever it is
     * representable. Returns nullopt below the threshold 2·digits.
     */
    template<real_number T>
    std::optional<T> half_exp_tail(const T& x) {
        const T a = decmath::abs(x);
        if (!(real_traits<T>::from_int(2 * real_traits<T>::digits) < a)) {
            return std::nullopt;
        }
        return decmath::exp(a - decmath::ln(T{2}));
    }

} // namespace detail

/**
 * @brief exp(x) - 1 without cancellation for small x
 *
 * Uses (u - 1)·x / ln(u) with u = exp(x), which cancels the rounding error of
 * u against that of ln(u).
 */
template<real_number T>
T expm1(const T& x) {
    if (is_special(x)) {
        return x;
    }
    const T u = decmath::exp(x);
    if (is_infinite(u)) {
        return u;
    }
    const T v = u - T{1};
    if (is_zero(v)) {
        return x;
    }
    if (v == T{-1}) {
        return v;
    }
    return v * x / decmath::ln(u);
}

/**
 * @brief ln(1 + x) without cancellation for small x
 */
template<real_number T>
T ln1p(const T& x) {
    if (is_special(x) || is_zero(x)) {
        return x;
    }
    const T u = x + T{1};
    const T v = u - T{1};
    if (is_zero(v)) {
        return x;
    }
    return decmath::ln(u) * (x / v);
}

/**
 * @brief Hyperbolic sine
 *
 * Below |x| = 0.5 the value is formed as (eˣ - 1)(eˣ + 1) / (2eˣ) from expm1;
 * above it as (eˣ - e⁻ˣ) / 2, and for large |x| as ±e^(|x| - ln 2).
 */
template<real_number T>
T sinh(const T& x) {
    if (is_special(x)) {
        return x;
    }
    using W = elevated_t<T>;
    const W w = narrow<W>(x);

    if (decmath::abs(w) < W{1} / W{2}) {
        W       u = decmath::expm1(w);
        const W t = u / W{2};
        u = u + W{1};
        const W v = t / u;
        u = u + W{1};
        return narrow<T>(u * v);
    }

    if (const auto tail = detail::half_exp_tail(w)) {
        return narrow<T>(is_negative(w) ? -*tail : *tail);
    }

    const W u = decmath::exp(w);
    return narrow<T>((u - W{1} / u) / W{2});
}

/// Hyperbolic cosine, (eˣ + e⁻ˣ) / 2, or e^(|x| - ln 2) for large |x|
template<real_number T>
T cosh(const T& x) {
    if (is_nan(x)) {
        return x;
    }
    if (is_infinite(x)) {
        return infinity<T>();
    }
    using W = elevated_t<T>;
    const W w = narrow<W>(x);
    if (const auto tail = detail::half_exp_tail(w)) {
        return narrow<T>(*tail);
    }
    const W u = decmath::exp(w);
    return narrow<T>((u + W{1} / u) / W{2});
}

/**
 * @brief Hyperbolic tangent, expm1(2x) / (expm1(2x) + 2)
 *
 * Saturates to ±1 for |x| > 100, where the quotient is 1 to far more digits
 * than any supported precision carries.
 */
template<real_number T>
T tanh(const T& x) {
    if (is_nan(x)) {
        return x;
    }
    if (T{100} < decmath::abs(x)) {
        return is_negative(x) ? T{-1} : T{1};
    }
    using W = elevated_t<T>;
    const W w = narrow<W>(x);
    const W b = decmath::expm1(w + w);
    return narrow<T>(b / (b + W{2}));
}

/**
 * @brief Inverse hyperbolic sine
 *
 * ln1p(x·(x / (sqrt(x² + 1) + 1) + 1)), evaluated on |x| and given the sign
 * of x afterwards so that large negative arguments do not cancel.
 */
template<real_number T>
T asinh(const T& x) {
    if (is_special(x) || is_zero(x)) {
        return x;
    }
    using W = elevated_t<T>;
    const bool neg = is_negative(x);
    const W    a = decmath::abs(narrow<W>(x));

    const W y = decmath::sqrt(a * a + W{1}) + W{1};
    const W r = decmath::ln1p(a * (a / y + W{1}));
    return narrow<T>(neg ? -r : r);
}

/**
 * @brief Inverse hyperbolic cosine, ln(x + sqrt(x² - 1))
 *
 * @return acosh(x) ≥ 0, or NaN when x < 1
 */
template<real_number T>
T acosh(const T& x) {
    if (is_nan(x) || x < T{1}) {
        return nan<T>();
    }
    if (is_infinite(x)) {
        return x;
    }
    if (x == T{1}) {
        return T{0};
    }
    using W = elevated_t<T>;
    const W w = narrow<W>(x);
    return narrow<T>(decmath::ln(w + decmath::sqrt(w * w - W{1})));
}

/**
 * @brief Inverse hyperbolic tangent, ln1p(2x / (1 - x)) / 2
 *
 * @return atanh(x); ±∞ at x = ±1 and NaN when |x| > 1
 */
template<real_number T>
T atanh(const T& x) {
    if (is_nan(x)) {
        return x;
    }
    const T a = decmath::abs(x);
    if (a == T{1}) {
        return is_negative(x) ? -infinity<T>() : infinity<T>();
    }
    if (T{1} < a) {
        return nan<T>();
    }
    if (is_zero(x)) {
        return x;
    }
    using W = elevated_t<T>;
    const W w = narrow<W>(x);
    return narrow<T>(decmath::ln1p(W{2} * w / (W{1} - w)) / W{2});
}

} // namespace decmath
