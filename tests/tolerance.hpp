#pragma once

#include <string_view>

#include "real_traits.hpp"

namespace decmath::test {

/// Value of a numeral known to be valid
template<real_number T>
T num(std::string_view s) {
    return real_traits<T>::from_string(s).value();
}

/**
 * @brief |a - b| ≤ tol·max(1, |b|)
 */
template<real_number T>
bool near(const T& a, const T& b, const T& tol) {
    if (is_nan(a) || is_nan(b)) {
        return false;
    }
    T scale = decmath::abs(b);
    if (scale < T{1}) {
        scale = T{1};
    }
    return !(tol * scale < decmath::abs(a - b));
}

} // namespace decmath::test
