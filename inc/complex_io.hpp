#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "complex.hpp"
#include "fmt/core.h"
#include "real_traits.hpp"

namespace decmath {

/**
 * @brief Canonical text form of a complex number
 *
 * A zero imaginary part is omitted, as is a zero real part when an imaginary
 * part is present. An imaginary coefficient of ±1 prints as a bare sign:
 * "3-4i", "2.5", "i", "-i", "1e-05+2i". Zero prints as "0".
 */
template<real_number T>
std::string to_string(const complex<T>& z) {
    using traits = real_traits<T>;

    std::string imag;
    if (!is_zero(z.imag_)) {
        const bool neg = is_negative(z.imag_);
        if (decmath::abs(z.imag_) == T{1}) {
            imag = neg ? "-i" : "+i";
        } else {
            imag = (neg ? "" : "+") + traits::to_string(z.imag_) + "i";
        }
    }

    if (is_zero(z.real_) && !imag.empty()) {
        if (imag.front() == '+') {
            imag.erase(0, 1);
        }
        return imag;
    }
    return traits::to_string(z.real_) + imag;
}

namespace detail {

    inline bool is_sign(char c) {
        return c == '+' || c == '-';
    }

    /// Position of the sign that starts a second component, or npos
    inline size_t component_split(std::string_view s) {
        for (size_t i = 1; i < s.size(); ++i) {
            if (is_sign(s[i]) && s[i - 1] != 'e') {
                return i;
            }
        }
        return std::string_view::npos;
    }

    /// Coefficient of an imaginary component with its trailing marker removed
    template<real_number T>
    std::optional<T> imaginary_coefficient(std::string_view s) {
        if (s.empty()) {
            return T{1};
        }
        if (s == "+") {
            return T{1};
        }
        if (s == "-") {
            return T{-1};
        }
        return real_traits<T>::from_string(s);
    }

} // namespace detail

/**
 * @brief Parse a complex number
 *
 * Accepts a real numeral, an imaginary numeral ending in `i`, or both joined
 * by the imaginary part's sign, e.g. "3-4i", "-2.5e-3+i", "1e-5-2i", "-i".
 * Spaces are ignored and letters are case-insensitive. A sign directly after
 * an exponent letter belongs to the exponent.
 *
 * @param text Input text
 *
 * @return The parsed value, or std::nullopt if the text is not a complex number
 */
template<real_number T>
std::optional<complex<T>> parse_complex(std::string_view text) {
    std::string s;
    s.reserve(text.size());
    for (const char c : text) {
        if (c != ' ') {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (s.empty()) {
        return std::nullopt;
    }

    std::string_view sv{s};
    std::string_view re_text;
    std::string_view im_text;

    const size_t split = detail::component_split(sv);
    if (split != std::string_view::npos) {
        re_text = sv.substr(0, split);
        im_text = sv.substr(split);
        if (im_text.back() != 'i') {
            return std::nullopt;
        }
    } else if (sv.back() == 'i') {
        im_text = sv;
    } else {
        re_text = sv;
    }

    complex<T> z;
    if (!re_text.empty()) {
        const auto re = real_traits<T>::from_string(re_text);
        if (!re) {
            return std::nullopt;
        }
        z.real_ = *re;
    }
    if (!im_text.empty()) {
        im_text.remove_suffix(1);
        const auto im = detail::imaginary_coefficient<T>(im_text);
        if (!im) {
            return std::nullopt;
        }
        z.imag_ = *im;
    }
    return z;
}

} // namespace decmath

/**
 * @brief fmt support for complex numbers, in the form produced by to_string
 */
template<typename T>
struct fmt::formatter<decmath::complex<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const decmath::complex<T>& z, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", decmath::to_string(z));
    }
};
