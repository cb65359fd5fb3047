#pragma once

#include "angle.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include "real_traits.hpp"
#include "series.hpp"

namespace decmath {

namespace detail {

    /**
     * @brief Arctangent in radians of any argument
     *
     * Folds the argument onto [0, 1] with atan(x) = π/2 - atan(1/x) and the
     * sign symmetry, then runs the Taylor kernel.
     */
    template<real_number T>
    series_result<T> atan_radians(const T& x) {
        if (is_nan(x)) {
            return {x, true};
        }
        const bool neg = is_negative(x);
        if (is_infinite(x)) {
            return {neg ? -half_pi<T>() : half_pi<T>(), true};
        }

        T a = neg ? -x : x;
        if (a == T{1}) {
            const T quarter = pi<T>() / T{4};
            return {neg ? -quarter : quarter, true};
        }

        const bool invert = T{1} < a;
        if (invert) {
            a = T{1} / a;
        }

        auto result = atan_taylor(a);
        if (invert) {
            result.value = half_pi<T>() - result.value;
        }
        if (neg) {
            result.value = -result.value;
        }
        return result;
    }

    template<real_number T>
    T not_converged(const char* function) {
        logger()->warn("{}: series did not settle within {} terms", function, max_series_terms);
        return nan<T>();
    }

} // namespace detail

/**
 * @brief Sine
 *
 * Exact multiples of a right angle return tabulated values; everything else
 * is summed by the Taylor kernel at twice the caller's precision.
 *
 * @param x    Angle
 * @param unit Unit of x (default: the process-wide unit)
 *
 * @return sin(x), or NaN for NaN or infinite x
 */
template<real_number T>
T sin(const T& x, angle_unit unit = default_angle_unit()) {
    if (is_special(x)) {
        return nan<T>();
    }

    using W = series_t<T>;
    const auto reduced = reduce_angle<W>(x, unit);
    if (reduced.quadrant) {
        constexpr int table[] = {0, 1, 0, -1};
        return real_traits<T>::from_int(table[*reduced.quadrant]);
    }

    const auto sc = sin_cos_taylor(reduced.radians);
    if (!sc.converged) {
        return detail::not_converged<T>("sin");
    }
    return narrow<T>(sc.sin);
}

/**
 * @brief Cosine
 *
 * @param x    Angle
 * @param unit Unit of x (default: the process-wide unit)
 *
 * @return cos(x), or NaN for NaN or infinite x
 */
template<real_number T>
T cos(const T& x, angle_unit unit = default_angle_unit()) {
    if (is_special(x)) {
        return nan<T>();
    }

    using W = series_t<T>;
    const auto reduced = reduce_angle<W>(x, unit);
    if (reduced.quadrant) {
        constexpr int table[] = {1, 0, -1, 0};
        return real_traits<T>::from_int(table[*reduced.quadrant]);
    }

    const auto sc = sin_cos_taylor(reduced.radians);
    if (!sc.converged) {
        return detail::not_converged<T>("cos");
    }
    return narrow<T>(sc.cos);
}

/**
 * @brief Tangent
 *
 * Odd multiples of a right angle have no tangent and return NaN.
 */
template<real_number T>
T tan(const T& x, angle_unit unit = default_angle_unit()) {
    if (is_special(x)) {
        return nan<T>();
    }

    using W = series_t<T>;
    const auto reduced = reduce_angle<W>(x, unit);
    if (reduced.quadrant) {
        return (*reduced.quadrant & 1) ? nan<T>() : T{0};
    }

    const auto sc = sin_cos_taylor(reduced.radians);
    if (!sc.converged) {
        return detail::not_converged<T>("tan");
    }
    return narrow<T>(sc.sin / sc.cos);
}

/**
 * @brief Sine and cosine of one angle from a single reduction
 *
 * Right-angle multiples take both values from the quadrant tables; anything
 * else runs the Taylor kernel once for both.
 *
 * @param x    Angle
 * @param unit Unit of x (default: the process-wide unit)
 *
 * @return sin(x) and cos(x); both NaN for NaN or infinite x. `converged` is
 *         false only when the kernel hit its cap, in which case both are NaN.
 */
template<real_number T>
sin_cos_result<T> sin_cos(const T& x, angle_unit unit = default_angle_unit()) {
    if (is_special(x)) {
        return {nan<T>(), nan<T>(), true};
    }

    using W = series_t<T>;
    const auto reduced = reduce_angle<W>(x, unit);
    if (reduced.quadrant) {
        constexpr int sin_table[] = {0, 1, 0, -1};
        constexpr int cos_table[] = {1, 0, -1, 0};
        return {real_traits<T>::from_int(sin_table[*reduced.quadrant]),
                real_traits<T>::from_int(cos_table[*reduced.quadrant]), true};
    }

    const auto sc = sin_cos_taylor(reduced.radians);
    if (!sc.converged) {
        const T v = detail::not_converged<T>("sin_cos");
        return {v, v, false};
    }
    return {narrow<T>(sc.sin), narrow<T>(sc.cos), true};
}

template<real_number T>
sin_cos_result<T> sin_cos(const angle<T>& a) {
    return decmath::sin_cos(a.value, a.unit);
}

template<real_number T>
T sin(const angle<T>& a) {
    return decmath::sin(a.value, a.unit);
}

template<real_number T>
T cos(const angle<T>& a) {
    return decmath::cos(a.value, a.unit);
}

template<real_number T>
T tan(const angle<T>& a) {
    return decmath::tan(a.value, a.unit);
}

/**
 * @brief Principal arctangent
 *
 * @param x    Any value; ±∞ maps to ±π/2
 * @param unit Unit of the result (default: the process-wide unit)
 *
 * @return atan(x) in (-π/2, π/2), expressed in `unit`
 */
template<real_number T>
T atan(const T& x, angle_unit unit = default_angle_unit()) {
    using W = elevated_t<T>;
    const auto r = detail::atan_radians(narrow<W>(x));
    if (!r.converged) {
        return detail::not_converged<T>("atan");
    }
    return narrow<T>(from_radians(r.value, unit));
}

/**
 * @brief Four-quadrant arctangent of y/x
 *
 * Zero, infinite and NaN operands are resolved by case analysis to the exact
 * values 0, ±π/4, ±π/2, ±3π/4 and ±π before any division takes place. A zero
 * result carries the sign of y.
 *
 * @param y    Ordinate
 * @param x    Abscissa
 * @param unit Unit of the result (default: the process-wide unit)
 *
 * @return Angle of (x, y) in (-π, π], expressed in `unit`
 */
template<real_number T>
T atan2(const T& y, const T& x, angle_unit unit = default_angle_unit()) {
    using W = elevated_t<T>;

    if (is_nan(x) || is_nan(y)) {
        return nan<T>();
    }

    const bool xneg = is_negative(x);
    const bool yneg = is_negative(y);
    const auto signed_by_y = [yneg](const W& v) { return yneg ? -v : v; };

    W at{};
    if (is_zero(y)) {
        if (xneg) {
            at = signed_by_y(pi<W>());
        } else {
            return y;
        }
    } else if (is_zero(x)) {
        at = signed_by_y(half_pi<W>());
    } else if (is_infinite(x)) {
        if (is_infinite(y)) {
            at = signed_by_y(xneg ? pi<W>() * W{3} / W{4} : pi<W>() / W{4});
        } else if (xneg) {
            at = signed_by_y(pi<W>());
        } else {
            return yneg ? -T{0} : T{0};
        }
    } else if (is_infinite(y)) {
        at = signed_by_y(half_pi<W>());
    } else {
        const auto r = detail::atan_radians(narrow<W>(y) / narrow<W>(x));
        if (!r.converged) {
            return detail::not_converged<T>("atan2");
        }
        at = r.value;
        if (xneg) {
            at = at + signed_by_y(pi<W>());
        }
        if (is_zero(at)) {
            return yneg ? -T{0} : T{0};
        }
    }
    return narrow<T>(from_radians(at, unit));
}

/**
 * @brief Principal arcsine, 2·atan(x / (1 + sqrt(1 - x²)))
 *
 * @return asin(x) in [-π/2, π/2] expressed in `unit`, or NaN when |x| > 1
 */
template<real_number T>
T asin(const T& x, angle_unit unit = default_angle_unit()) {
    using W = elevated_t<T>;

    if (is_nan(x) || T{1} < decmath::abs(x)) {
        return nan<T>();
    }

    const W w = narrow<W>(x);
    const W z = w / (W{1} + decmath::sqrt(W{1} - w * w));
    const auto r = detail::atan_radians(z);
    if (!r.converged) {
        return detail::not_converged<T>("asin");
    }
    return narrow<T>(from_radians(W{2} * r.value, unit));
}

/**
 * @brief Principal arccosine, 2·atan((1 - x) / sqrt(1 - x²))
 *
 * @return acos(x) in [0, π] expressed in `unit`, or NaN when |x| > 1
 */
template<real_number T>
T acos(const T& x, angle_unit unit = default_angle_unit()) {
    using W = elevated_t<T>;

    if (is_nan(x) || T{1} < decmath::abs(x)) {
        return nan<T>();
    }
    if (x == T{1}) {
        return T{0};
    }
    if (x == T{-1}) {
        return narrow<T>(from_radians(pi<W>(), unit));
    }

    const W w = narrow<W>(x);
    const W z = (W{1} - w) / decmath::sqrt(W{1} - w * w);
    const auto r = detail::atan_radians(z);
    if (!r.converged) {
        return detail::not_converged<T>("acos");
    }
    return narrow<T>(from_radians(W{2} * r.value, unit));
}

} // namespace decmath
