#pragma once

#include "angle.hpp"
#include "constants.hpp"
#include "hyperbolic.hpp"
#include "real_traits.hpp"
#include "trig.hpp"

namespace decmath {

/**
 * @brief Complex number over any real_number type
 * @ingroup complex
 *
 * Arithmetic is component-wise except for division, which scales by the
 * larger component of the divisor. Every transcendental function is derived
 * from exp and ln of the real type; angles are always in radians.
 *
 * @tparam T Real type (e.g. decimal34, double)
 */
template<real_number T>
struct complex {
    T real_, imag_;

    /**
     * @brief Constructs complex number (r + i*i)
     * @param r Real part (default: 0)
     * @param i Imaginary part (default: 0)
     */
    complex(T r = T{}, T i = T{}) : real_(r), imag_(i) {}

    /**
     * @brief Binary addition operator
     * @param other Complex number to add
     * @return Sum of this and other
     */
    complex operator+(const complex& other) const {
        return {real_ + other.real_, imag_ + other.imag_};
    }

    /**
     * @brief Binary subtraction operator
     * @param other Complex number to subtract
     * @return Difference of this and other
     */
    complex operator-(const complex& other) const {
        return {real_ - other.real_, imag_ - other.imag_};
    }

    /**
     * @brief Unary negation operator
     * @return Negated complex number
     */
    complex operator-() const {
        return {-real_, -imag_};
    }

    /**
     * @brief Unary plus operator
     * @return Copy of this
     */
    complex operator+() const {
        return *this;
    }

    /**
     * @brief Binary multiplication operator
     * @param other Complex number to multiply
     * @return Product of this and other
     */
    complex operator*(const complex& other) const {
        return {real_ * other.real_ - imag_ * other.imag_, real_ * other.imag_ + imag_ * other.real_};
    }

    /**
     * @brief Binary division operator
     *
     * Divides through by the larger of |Re(other)| and |Im(other)| first so
     * that neither the squared magnitude nor its reciprocal is ever formed.
     *
     * @param other Complex number to divide by
     * @return Quotient of this and other
     */
    complex operator/(const complex& other) const {
        if (!(decmath::abs(other.real_) < decmath::abs(other.imag_))) {
            const T r = other.imag_ / other.real_;
            const T d = other.real_ + other.imag_ * r;
            return {(real_ + imag_ * r) / d, (imag_ - real_ * r) / d};
        }
        const T r = other.real_ / other.imag_;
        const T d = other.real_ * r + other.imag_;
        return {(real_ * r + imag_) / d, (imag_ * r - real_) / d};
    }

    /**
     * @brief Compound addition operator
     * @param other Complex number to add
     * @return Reference to this
     */
    complex& operator+=(const complex& other) {
        real_ = real_ + other.real_;
        imag_ = imag_ + other.imag_;
        return *this;
    }

    /**
     * @brief Compound subtraction operator
     * @param other Complex number to subtract
     * @return Reference to this
     */
    complex& operator-=(const complex& other) {
        real_ = real_ - other.real_;
        imag_ = imag_ - other.imag_;
        return *this;
    }

    /**
     * @brief Compound multiplication operator
     * @param other Complex number to multiply
     * @return Reference to this
     */
    complex& operator*=(const complex& other) {
        *this = *this * other;
        return *this;
    }

    /**
     * @brief Compound division operator
     * @param other Complex number to divide by
     * @return Reference to this
     */
    complex& operator/=(const complex& other) {
        *this = *this / other;
        return *this;
    }

    /**
     * @brief Scalar addition operator
     * @param scalar Real scalar to add
     * @return Sum of this and scalar
     */
    complex operator+(const T& scalar) const {
        return {real_ + scalar, imag_};
    }

    /**
     * @brief Scalar subtraction operator
     * @param scalar Real scalar to subtract
     * @return Difference of this and scalar
     */
    complex operator-(const T& scalar) const {
        return {real_ - scalar, imag_};
    }

    /**
     * @brief Scalar multiplication operator
     * @param scalar Real scalar multiplier
     * @return Product of this and scalar
     */
    complex operator*(const T& scalar) const {
        return {real_ * scalar, imag_ * scalar};
    }

    /**
     * @brief Scalar division operator
     * @param scalar Real scalar divisor
     * @return Quotient of this and scalar
     */
    complex operator/(const T& scalar) const {
        return {real_ / scalar, imag_ / scalar};
    }

    /**
     * @brief Compound scalar addition operator
     * @param scalar Real scalar to add
     * @return Reference to this
     */
    complex& operator+=(const T& scalar) {
        real_ = real_ + scalar;
        return *this;
    }

    /**
     * @brief Compound scalar subtraction operator
     * @param scalar Real scalar to subtract
     * @return Reference to this
     */
    complex& operator-=(const T& scalar) {
        real_ = real_ - scalar;
        return *this;
    }

    /**
     * @brief Compound scalar multiplication operator
     * @param scalar Real scalar multiplier
     * @return Reference to this
     */
    complex& operator*=(const T& scalar) {
        real_ = real_ * scalar;
        imag_ = imag_ * scalar;
        return *this;
    }

    /**
     * @brief Compound scalar division operator
     * @param scalar Real scalar divisor
     * @return Reference to this
     */
    complex& operator/=(const T& scalar) {
        real_ = real_ / scalar;
        imag_ = imag_ / scalar;
        return *this;
    }

    /**
     * @brief Get real part
     * @return Real component
     */
    T real() const {
        return real_;
    }

    /**
     * @brief Get imaginary part
     * @return Imaginary component
     */
    T imag() const {
        return imag_;
    }

    /**
     * @brief Magnitude |z| = hypot(real, imag)
     */
    T abs() const {
        return decmath::hypot(real_, imag_);
    }

    /// Same as abs(); the magnitude, not its square
    T norm() const {
        return abs();
    }

    /**
     * @brief Argument in radians, in (-π, π]
     */
    T arg() const {
        return decmath::atan2(imag_, real_, angle_unit::radians);
    }

    /**
     * @brief Compute complex conjugate
     * @return Complex conjugate (real - i*imag)
     */
    complex conj() const {
        return {real_, -imag_};
    }

    /**
     * @brief Projection onto the Riemann sphere
     *
     * @return *this when both parts are finite, otherwise (+∞, ±0) with the
     *         sign of the imaginary part
     */
    complex proj() const {
        if (!is_special(real_) && !is_special(imag_)) {
            return *this;
        }
        return {infinity<T>(), is_negative(imag_) ? -T{0} : T{0}};
    }

    /// z·i, a quarter turn counter-clockwise
    complex times_i() const {
        return {-imag_, real_};
    }

    /**
     * @brief Rescale to the given magnitude, keeping the argument
     */
    void set_abs(const T& r) {
        const T f = r / abs();
        real_ = real_ * f;
        imag_ = imag_ * f;
    }

    /**
     * @brief Rotate to the given argument in radians, keeping the magnitude
     */
    void set_arg(const T& t) {
        const T m = abs();
        real_ = m * decmath::cos(t, angle_unit::radians);
        imag_ = m * decmath::sin(t, angle_unit::radians);
    }

    /**
     * @brief Equality comparison operator
     * @param other Complex number to compare
     * @return True if real and imaginary parts are equal
     */
    bool operator==(const complex& other) const {
        return real_ == other.real_ && imag_ == other.imag_;
    }

    /// Equal to a real number when the imaginary part is zero
    bool operator==(const T& r) const {
        return real_ == r && is_zero(imag_);
    }
};

/**
 * @brief Scalar-complex multiplication (scalar * complex)
 * @tparam T Underlying real type
 * @param scalar Real scalar multiplier
 * @param c Complex number
 * @return Product scalar * c
 */
template<real_number T>
complex<T> operator*(const T& scalar, const complex<T>& c) {
    return {scalar * c.real_, scalar * c.imag_};
}

/**
 * @brief Scalar-complex addition (scalar + complex)
 * @tparam T Underlying real type
 * @param scalar Real scalar to add
 * @param c Complex number
 * @return Sum scalar + c
 */
template<real_number T>
complex<T> operator+(const T& scalar, const complex<T>& c) {
    return {scalar + c.real_, c.imag_};
}

/**
 * @brief Scalar-complex subtraction (scalar - complex)
 * @tparam T Underlying real type
 * @param scalar Real scalar minuend
 * @param c Complex number
 * @return Difference scalar - c
 */
template<real_number T>
complex<T> operator-(const T& scalar, const complex<T>& c) {
    return {scalar - c.real_, -c.imag_};
}

/**
 * @brief Scalar-complex division (scalar / complex)
 * @tparam T Underlying real type
 * @param scalar Real scalar dividend
 * @param c Complex number
 * @return Quotient scalar / c
 */
template<real_number T>
complex<T> operator/(const T& scalar, const complex<T>& c) {
    return complex<T>{scalar} / c;
}

/**
 * @brief Complex number from magnitude and argument
 * @param r     Magnitude
 * @param theta Argument in radians
 */
template<real_number T>
complex<T> polar(const T& r, const T& theta) {
    return {r * decmath::cos(theta, angle_unit::radians), r * decmath::sin(theta, angle_unit::radians)};
}

template<real_number T>
T abs(const complex<T>& z) {
    return z.abs();
}

template<real_number T>
T arg(const complex<T>& z) {
    return z.arg();
}

template<real_number T>
T norm(const complex<T>& z) {
    return z.norm();
}

template<real_number T>
complex<T> conj(const complex<T>& z) {
    return z.conj();
}

template<real_number T>
complex<T> proj(const complex<T>& z) {
    return z.proj();
}

/**
 * @brief e^z = e^Re(z)·(cos Im(z) + i·sin Im(z))
 */
template<real_number T>
complex<T> exp(const complex<T>& z) {
    const T m = decmath::exp(z.real_);
    return {m * decmath::cos(z.imag_, angle_unit::radians), m * decmath::sin(z.imag_, angle_unit::radians)};
}

/**
 * @brief Principal natural logarithm, ln|z| + i·arg(z)
 */
template<real_number T>
complex<T> ln(const complex<T>& z) {
    return {decmath::ln(z.abs()), z.arg()};
}

template<real_number T>
complex<T> log10(const complex<T>& z) {
    return decmath::ln(z) / decmath::ln(T{10});
}

/**
 * @brief Principal square root
 *
 * With d = |z|, returns sqrt((d + Re z)/2) + i·sqrt((d - Re z)/2), the
 * imaginary part taking the sign of Im z.
 */
template<real_number T>
complex<T> sqrt(const complex<T>& z) {
    const T d = z.abs();
    const T re = decmath::sqrt((z.real_ + d) / T{2});
    const T im = decmath::sqrt((d - z.real_) / T{2});
    return {re, is_negative(z.imag_) ? -im : im};
}

/**
 * @brief Principal cube root, cbrt(|z|)·e^(i·arg(z)/3)
 */
template<real_number T>
complex<T> cbrt(const complex<T>& z) {
    if (is_zero(z.real_) && is_zero(z.imag_)) {
        return z;
    }
    return decmath::polar(decmath::cbrt(z.abs()), z.arg() / T{3});
}

/**
 * @brief Integer power by repeated squaring
 *
 * A real base is handed to the real pow. A negative exponent inverts the
 * result of the positive one.
 *
 * @param z Base
 * @param n Exponent
 *
 * @return zⁿ
 */
template<real_number T>
complex<T> ipow(const complex<T>& z, long long n) {
    if (is_zero(z.imag_)) {
        return complex<T>{decmath::pow(z.real_, real_traits<T>::from_int(n))};
    }

    complex<T>         y{T{1}};
    complex<T>         x = z;
    const bool         negative = n < 0;
    unsigned long long i = negative ? 0ULL - static_cast<unsigned long long>(n) : static_cast<unsigned long long>(n);
    while (true) {
        if (i & 1ULL) {
            y *= x;
        }
        i >>= 1;
        if (i == 0) {
            break;
        }
        x *= x;
    }
    return negative ? T{1} / y : y;
}

/**
 * @brief General power bᵖ
 *
 * A zero base gives 1 for p = 0, 0 when Re(p) > 0, +∞ for a negative real
 * exponent and NaN otherwise. A real integral exponent that fits a long long
 * goes through ipow; anything else is exp(p·ln b).
 */
template<real_number T>
complex<T> pow(const complex<T>& b, const complex<T>& p) {
    if (is_zero(b.real_) && is_zero(b.imag_)) {
        if (is_zero(p.real_) && is_zero(p.imag_)) {
            return complex<T>{T{1}};
        }
        if (T{0} < p.real_) {
            return complex<T>{};
        }
        if (is_zero(p.imag_) && is_negative(p.real_)) {
            return complex<T>{infinity<T>()};
        }
        return complex<T>{nan<T>(), nan<T>()};
    }

    if (is_zero(p.imag_) && is_integer(p.real_)) {
        const T limit = real_traits<T>::from_int(9'000'000'000'000'000'000LL);
        if (decmath::abs(p.real_) < limit) {
            return decmath::ipow(b, real_traits<T>::to_int(p.real_));
        }
    }
    return decmath::exp(decmath::ln(b) * p);
}

template<real_number T>
complex<T> pow(const complex<T>& b, const T& p) {
    return decmath::pow(b, complex<T>{p});
}

template<real_number T>
complex<T> pow(const T& b, const complex<T>& p) {
    return decmath::pow(complex<T>{b}, p);
}

/// b = pow(b, p)
template<real_number T>
complex<T>& pow_assign(complex<T>& b, const complex<T>& p) {
    b = decmath::pow(b, p);
    return b;
}

template<real_number T>
complex<T>& pow_assign(complex<T>& b, const T& p) {
    b = decmath::pow(b, complex<T>{p});
    return b;
}

/**
 * @brief Complex cosine, (e^(iz) + e^(-iz)) / 2
 */
template<real_number T>
complex<T> cos(const complex<T>& z) {
    const complex<T> iz = z.times_i();
    return (decmath::exp(iz) + decmath::exp(-iz)) / T{2};
}

/**
 * @brief Complex sine, -i·(e^(iz) - e^(-iz)) / 2
 */
template<real_number T>
complex<T> sin(const complex<T>& z) {
    const complex<T> iz = z.times_i();
    return -(decmath::exp(iz) - decmath::exp(-iz)).times_i() / T{2};
}

template<real_number T>
complex<T> tan(const complex<T>& z) {
    const complex<T> iz = z.times_i();
    const complex<T> a = decmath::exp(iz);
    const complex<T> b = decmath::exp(-iz);
    return (a - b) / (a + b).times_i();
}

/// i·(ln(1 - iz) - ln(1 + iz)) / 2
template<real_number T>
complex<T> atan(const complex<T>& z) {
    const complex<T> iz = z.times_i();
    return (decmath::ln(T{1} - iz) - decmath::ln(T{1} + iz)).times_i() / T{2};
}

/// atan(z / w)
template<real_number T>
complex<T> atan2(const complex<T>& z, const complex<T>& w) {
    return decmath::atan(z / w);
}

/// -i·ln(iz + sqrt(1 - z²))
template<real_number T>
complex<T> asin(const complex<T>& z) {
    return -decmath::ln(z.times_i() + decmath::sqrt(T{1} - z * z)).times_i();
}

/// i·ln(z - i·sqrt(1 - z²))
template<real_number T>
complex<T> acos(const complex<T>& z) {
    return decmath::ln(z - decmath::sqrt(T{1} - z * z).times_i()).times_i();
}

template<real_number T>
complex<T> sinh(const complex<T>& z) {
    return (decmath::exp(z) - decmath::exp(-z)) / T{2};
}

template<real_number T>
complex<T> cosh(const complex<T>& z) {
    return (decmath::exp(z) + decmath::exp(-z)) / T{2};
}

template<real_number T>
complex<T> tanh(const complex<T>& z) {
    const complex<T> a = decmath::exp(z);
    const complex<T> b = decmath::exp(-z);
    return (a - b) / (a + b);
}

/// ln(z + sqrt(z² + 1))
template<real_number T>
complex<T> asinh(const complex<T>& z) {
    return decmath::ln(z + decmath::sqrt(z * z + T{1}));
}

/// ln(z + sqrt(z² - 1))
template<real_number T>
complex<T> acosh(const complex<T>& z) {
    return decmath::ln(z + decmath::sqrt(z * z - T{1}));
}

/// ln((1 + z) / (1 - z)) / 2
template<real_number T>
complex<T> atanh(const complex<T>& z) {
    return decmath::ln((T{1} + z) / (T{1} - z)) / T{2};
}

namespace detail {

    template<real_number T>
    bool approx_magnitude(const T& a, const T& b) {
        if (a == b) {
            return true;
        }
        const T t = (b - a) / b;
        return !(T{2} * real_traits<T>::epsilon() < decmath::abs(t));
    }

} // namespace detail

/**
 * @brief Approximate equality
 *
 * True when the values are equal, or when their magnitudes differ relatively
 * by at most two units of epsilon.
 */
template<real_number T>
bool approx_equal(const complex<T>& a, const complex<T>& b) {
    return a == b || detail::approx_magnitude(a.abs(), b.abs());
}

template<real_number T>
bool approx_equal(const complex<T>& a, const T& b) {
    return detail::approx_magnitude(a.abs(), decmath::abs(b));
}

template<real_number T>
bool approx_equal(const T& a, const complex<T>& b) {
    return detail::approx_magnitude(decmath::abs(a), b.abs());
}

template<real_number T>
bool not_approx_equal(const complex<T>& a, const complex<T>& b) {
    return !decmath::approx_equal(a, b);
}

template<real_number T>
bool not_approx_equal(const complex<T>& a, const T& b) {
    return !decmath::approx_equal(a, b);
}

template<real_number T>
bool not_approx_equal(const T& a, const complex<T>& b) {
    return !decmath::approx_equal(a, b);
}

} // namespace decmath
