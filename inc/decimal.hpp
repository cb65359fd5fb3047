#pragma once

#include <cctype>
#include <ios>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include "fmt/core.h"
#include "real_traits.hpp"

namespace decmath {

/**
 * @brief Arbitrary-precision radix-10 floating-point value
 * @ingroup real
 *
 * Boost.Multiprecision cpp_dec_float with expression templates disabled so every
 * arithmetic expression yields a concrete value. The digit count is a template
 * parameter: two computations at different precisions are different types and
 * never share state.
 *
 * @tparam Digits10 Number of significant decimal digits
 */
template<unsigned Digits10>
using decimal = boost::multiprecision::number<boost::multiprecision::cpp_dec_float<Digits10>, boost::multiprecision::et_off>;

using decimal34 = decimal<34>;   ///< IEEE decimal128 significand width
using decimal50 = decimal<50>;
using decimal100 = decimal<100>;

namespace detail {

    /**
     * @brief Validate the free-standing numeral grammar
     *
     * Accepts `[+-]? (d+ (. d*)? | . d+) ([eE] [+-]? d+)?` as well as the
     * special spellings `inf`, `infinity` and `nan` after an optional sign.
     */
    inline bool is_decimal_numeral(std::string_view s) {
        size_t pos = 0;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
            ++pos;
        }

        const auto rest = s.substr(pos);
        if (rest == "inf" || rest == "infinity" || rest == "nan") {
            return true;
        }

        size_t mantissa_digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            ++pos;
            ++mantissa_digits;
        }
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                ++pos;
                ++mantissa_digits;
            }
        }
        if (mantissa_digits == 0) {
            return false;
        }

        if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
            ++pos;
            if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
                ++pos;
            }
            size_t exponent_digits = 0;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                ++pos;
                ++exponent_digits;
            }
            if (exponent_digits == 0 || exponent_digits > 9) {
                return false;
            }
        }
        return pos == s.size();
    }

} // namespace detail

/**
 * @brief real_traits model for decimal<Digits10>
 *
 * Every primitive is one Boost.Multiprecision call; hypot uses the scaled
 * form max * sqrt(1 + (min/max)^2) so the squares never overflow.
 */
template<unsigned Digits10>
struct real_traits<decimal<Digits10>> {
    using value_type = decimal<Digits10>;

    static constexpr int digits = static_cast<int>(Digits10);

    template<int D>
    using rebind = decimal<static_cast<unsigned>(D)>;

    static value_type from_int(long long v) { return value_type{v}; }
    static value_type from_uint(unsigned long long v) { return value_type{v}; }
    static long long to_int(const value_type& x) { return x.template convert_to<long long>(); }

    static std::optional<value_type> from_string(std::string_view s) {
        if (!detail::is_decimal_numeral(s)) {
            return std::nullopt;
        }
        try {
            const std::string text{s};
            return value_type{text.c_str()};
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
    }

    static std::string to_string(const value_type& x) { return x.str(digits, std::ios_base::fmtflags(0)); }

    static value_type sqrt(const value_type& x) { return boost::multiprecision::sqrt(x); }
    static value_type exp(const value_type& x) { return boost::multiprecision::exp(x); }
    static value_type ln(const value_type& x) { return boost::multiprecision::log(x); }
    static value_type log10(const value_type& x) { return boost::multiprecision::log10(x); }
    static value_type pow(const value_type& x, const value_type& y) { return boost::multiprecision::pow(x, y); }
    static value_type abs(const value_type& x) { return boost::multiprecision::abs(x); }
    static value_type trunc(const value_type& x) { return boost::multiprecision::trunc(x); }

    static value_type hypot(const value_type& x, const value_type& y) {
        if (is_nan(x) || is_nan(y)) {
            return nan();
        }
        if (is_infinite(x) || is_infinite(y)) {
            return infinity();
        }
        value_type a = abs(x);
        value_type b = abs(y);
        if (a < b) {
            std::swap(a, b);
        }
        if (is_zero(a)) {
            return a;
        }
        const value_type t = b / a;
        return a * sqrt(value_type{1} + t * t);
    }

    /**
     * @brief Truncating remainder x - trunc(x/y)·y
     *
     * The quotient goes through a reciprocal and can land one unit short of an
     * exact integer, so the result is pulled back into [0, |y|) or (-|y|, 0]
     * following the sign of x.
     */
    static value_type remainder(const value_type& x, const value_type& y) {
        if (is_special(x) || is_nan(y) || is_zero(y)) {
            return nan();
        }
        if (is_infinite(y) || is_zero(x)) {
            return x;
        }
        const value_type m = abs(y);
        value_type       r = x - trunc(x / y) * y;
        if (!is_negative(x)) {
            if (is_negative(r)) {
                r = r + m;
            } else if (!(r < m)) {
                r = r - m;
            }
        } else {
            if (!is_negative(r) && !is_zero(r)) {
                r = r - m;
            } else if (!(-m < r)) {
                r = r + m;
            }
        }
        return r;
    }

    static std::partial_ordering compare(const value_type& a, const value_type& b) {
        if (is_nan(a) || is_nan(b)) {
            return std::partial_ordering::unordered;
        }
        const int c = a.compare(b);
        if (c < 0) {
            return std::partial_ordering::less;
        }
        if (c > 0) {
            return std::partial_ordering::greater;
        }
        return std::partial_ordering::equivalent;
    }

    static bool is_zero(const value_type& x) { return x.backend().iszero(); }
    static bool is_negative(const value_type& x) { return x.backend().isneg() && !is_nan(x); }
    static bool is_integer(const value_type& x) { return x.backend().isint(); }
    static bool is_nan(const value_type& x) { return boost::multiprecision::isnan(x); }
    static bool is_infinite(const value_type& x) { return boost::multiprecision::isinf(x); }
    static bool is_special(const value_type& x) { return !boost::multiprecision::isfinite(x); }

    static value_type nan() { return std::numeric_limits<value_type>::quiet_NaN(); }
    static value_type infinity() { return std::numeric_limits<value_type>::infinity(); }
    static value_type epsilon() { return std::numeric_limits<value_type>::epsilon(); }
};

} // namespace decmath

/**
 * @brief fmt support for decimal values, printed at their full digit count
 */
template<unsigned Digits10>
struct fmt::formatter<decmath::decimal<Digits10>> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const decmath::decimal<Digits10>& x, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", decmath::real_traits<decmath::decimal<Digits10>>::to_string(x));
    }
};
