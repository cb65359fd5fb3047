#pragma once

#include <atomic>
#include <optional>

#include "constants.hpp"
#include "real_traits.hpp"

namespace decmath {

/**
 * @brief Measurement unit of an angle
 * @ingroup trig
 */
enum class angle_unit {
    radians,
    degrees,
    gradians,
};

/**
 * @brief Angle value tagged with its unit
 *
 * The unit only matters when the value is converted at the trigonometric
 * boundary; arithmetic on `value` is plain real arithmetic.
 */
template<real_number T>
struct angle {
    T          value{};
    angle_unit unit = angle_unit::radians;
};

namespace detail {
    inline std::atomic<angle_unit> default_unit{angle_unit::radians};
} // namespace detail

/**
 * @brief Unit applied by trigonometric functions when none is given
 */
inline angle_unit default_angle_unit() noexcept {
    return detail::default_unit.load(std::memory_order_relaxed);
}

inline void set_default_angle_unit(angle_unit unit) noexcept {
    detail::default_unit.store(unit, std::memory_order_relaxed);
}

/**
 * @brief Size of a full turn in the given unit (2π, 360 or 400)
 */
template<real_number T>
T full_turn(angle_unit unit) {
    switch (unit) {
        case angle_unit::degrees:
            return T{360};
        case angle_unit::gradians:
            return T{400};
        case angle_unit::radians:
            break;
    }
    return two_pi<T>();
}

template<real_number T>
T to_radians(const T& x, angle_unit unit) {
    if (unit == angle_unit::radians) {
        return x;
    }
    return x * two_pi<T>() / full_turn<T>(unit);
}

template<real_number T>
T from_radians(const T& x, angle_unit unit) {
    if (unit == angle_unit::radians) {
        return x;
    }
    return x * full_turn<T>(unit) / two_pi<T>();
}

/**
 * @brief Angle mapped onto one turn
 *
 * When the input is an exact multiple of a right angle only `quadrant` is
 * meaningful (0 → 0, 1 → a quarter turn, 2 → half, 3 → three quarters) and the
 * caller returns a tabulated value. Otherwise `radians` lies in [0, 2π).
 */
template<real_number T>
struct reduced_angle {
    T                  radians{};
    std::optional<int> quadrant;
};

/**
 * @brief Reduce an angle to radians in [0, 2π)
 *
 * The right-angle test runs at the caller's precision so that values such as
 * pi<T>() / 2 or 270 degrees are recognised exactly. The conversion itself is
 * carried out in the working type W.
 *
 * @tparam W   Working type of the result
 * @tparam T   Type of the input angle
 * @param x    Angle value, finite
 * @param unit Unit of x
 *
 * @return Reduced radians, or the quadrant index for exact right-angle multiples
 */
template<real_number W, real_number T>
reduced_angle<W> reduce_angle(const T& x, angle_unit unit) {
    const bool radians = unit == angle_unit::radians;
    const T    turn = full_turn<T>(unit);
    const T    quarter = radians ? half_pi<T>() : turn / T{4};
    const T    half = radians ? pi<T>() : turn / T{2};

    T fm = real_traits<T>::remainder(x, turn);
    if (is_negative(fm)) {
        fm = fm + turn;
    }
    if (fm == turn) {
        fm = T{0};
    }

    if (is_zero(real_traits<T>::remainder(fm, quarter))) {
        if (is_zero(fm)) {
            return {W{}, 0};
        }
        if (fm == half) {
            return {W{}, 2};
        }
        return {W{}, fm < half ? 1 : 3};
    }

    const W wide_turn = full_turn<W>(unit);
    W       wide = real_traits<W>::remainder(narrow<W>(x), wide_turn);
    if (is_negative(wide)) {
        wide = wide + wide_turn;
    }
    if (!radians) {
        wide = wide * two_pi<W>() / wide_turn;
    }
    return {wide, std::nullopt};
}

/// Overload taking a tagged angle
template<real_number W, real_number T>
reduced_angle<W> reduce_angle(const angle<T>& a) {
    return reduce_angle<W>(a.value, a.unit);
}

} // namespace decmath
