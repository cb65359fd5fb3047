#include <cmath>

#include "angle.hpp"
#include "constants.hpp"
#include "decimal.hpp"
#include "doctest.h"
#include "tolerance.hpp"
#include "trig.hpp"

using decmath::angle_unit;
using decmath::decimal34;
using decmath::test::near;
using decmath::test::num;

namespace {

const decimal34 pi_ref = num<decimal34>("3.141592653589793238462643383279502884197");
const decimal34 tol = num<decimal34>("1e-31");

} // namespace

TEST_SUITE("trig") {
    TEST_CASE("right-angle multiples are exact") {
        CHECK(decmath::sin(decmath::half_pi<decimal34>(), angle_unit::radians) == decimal34{1});
        CHECK(decmath::cos(decimal34{0}, angle_unit::radians) == decimal34{1});
        CHECK(decmath::sin(decimal34{0}, angle_unit::radians) == decimal34{0});

        CHECK(decmath::sin(decimal34{90}, angle_unit::degrees) == decimal34{1});
        CHECK(decmath::sin(decimal34{180}, angle_unit::degrees) == decimal34{0});
        CHECK(decmath::sin(decimal34{270}, angle_unit::degrees) == decimal34{-1});
        CHECK(decmath::sin(decimal34{-90}, angle_unit::degrees) == decimal34{-1});
        CHECK(decmath::cos(decimal34{180}, angle_unit::degrees) == decimal34{-1});
        CHECK(decmath::cos(decimal34{90}, angle_unit::degrees) == decimal34{0});
        CHECK(decmath::cos(decimal34{200}, angle_unit::gradians) == decimal34{-1});

        CHECK(decmath::tan(decimal34{180}, angle_unit::degrees) == decimal34{0});
        CHECK(decmath::is_nan(decmath::tan(decimal34{90}, angle_unit::degrees)));
        CHECK(decmath::is_nan(decmath::tan(decimal34{300}, angle_unit::gradians)));
    }

    TEST_CASE("series values") {
        CHECK(near(decmath::sin(decimal34{30}, angle_unit::degrees), num<decimal34>("0.5"), tol));
        CHECK(near(decmath::cos(decimal34{30}, angle_unit::degrees), num<decimal34>("0.8660254037844386467637231707529361834714"), tol));
        CHECK(near(decmath::tan(decimal34{45}, angle_unit::degrees), decimal34{1}, tol));
        CHECK(near(decmath::sin(decimal34{1}, angle_unit::radians), num<decimal34>("0.8414709848078965066525023216302989996"), tol));
        CHECK(near(decmath::cos(decimal34{-1}, angle_unit::radians), num<decimal34>("0.5403023058681397174009366074429766037"), tol));
        CHECK(near(decmath::sin(decimal34{50}, angle_unit::gradians), num<decimal34>("0.7071067811865475244008443621048490392848"), tol));

        CHECK(decmath::sin(0.5) == doctest::Approx(std::sin(0.5)));
        CHECK(decmath::cos(2.0) == doctest::Approx(std::cos(2.0)));
        CHECK(decmath::tan(-0.3) == doctest::Approx(std::tan(-0.3)));
    }

    TEST_CASE("tagged angles and the default unit") {
        const decmath::angle<decimal34> right{decimal34{90}, angle_unit::degrees};
        CHECK(decmath::sin(right) == decimal34{1});
        CHECK(decmath::cos(right) == decimal34{0});

        const angle_unit saved = decmath::default_angle_unit();
        decmath::set_default_angle_unit(angle_unit::degrees);
        CHECK(decmath::sin(decimal34{270}) == decimal34{-1});
        CHECK(near(decmath::atan(decimal34{1}), decimal34{45}, tol));
        decmath::set_default_angle_unit(saved);
    }

    TEST_CASE("sine and cosine together") {
        const auto right = decmath::sin_cos(decimal34{90}, angle_unit::degrees);
        CHECK(right.converged);
        CHECK(right.sin == decimal34{1});
        CHECK(right.cos == decimal34{0});

        const auto thirty = decmath::sin_cos(decimal34{30}, angle_unit::degrees);
        CHECK(thirty.converged);
        CHECK(near(thirty.sin, num<decimal34>("0.5"), tol));
        CHECK(near(thirty.cos, num<decimal34>("0.8660254037844386467637231707529361834714"), tol));

        const auto wrapped = decmath::sin_cos(decimal34{-330}, angle_unit::degrees);
        CHECK(near(wrapped.sin, num<decimal34>("0.5"), tol));
        CHECK(near(wrapped.cos, thirty.cos, tol));

        const decmath::angle<decimal34> straight{decimal34{200}, angle_unit::gradians};
        const auto half_turn = decmath::sin_cos(straight);
        CHECK(half_turn.sin == decimal34{0});
        CHECK(half_turn.cos == decimal34{-1});

        const auto one = decmath::sin_cos(decimal34{1}, angle_unit::radians);
        CHECK(one.sin == decmath::sin(decimal34{1}, angle_unit::radians));
        CHECK(one.cos == decmath::cos(decimal34{1}, angle_unit::radians));

        const auto inf = decmath::sin_cos(decmath::infinity<decimal34>());
        CHECK(decmath::is_nan(inf.sin));
        CHECK(decmath::is_nan(inf.cos));
        const auto not_a_number = decmath::sin_cos(decmath::nan<double>());
        CHECK(std::isnan(not_a_number.sin));
        CHECK(std::isnan(not_a_number.cos));

        const auto d = decmath::sin_cos(0.5);
        CHECK(d.sin == doctest::Approx(std::sin(0.5)));
        CHECK(d.cos == doctest::Approx(std::cos(0.5)));
    }

    TEST_CASE("an unsettled series yields NaN") {
        CHECK(decmath::is_nan(decmath::detail::not_converged<decimal34>("sin")));
        CHECK(std::isnan(decmath::detail::not_converged<double>("atan")));
    }

    TEST_CASE("non-finite arguments") {
        CHECK(decmath::is_nan(decmath::sin(decmath::infinity<decimal34>())));
        CHECK(decmath::is_nan(decmath::cos(decmath::nan<decimal34>())));
        CHECK(decmath::is_nan(decmath::tan(-decmath::infinity<decimal34>())));
    }

    TEST_CASE("atan") {
        CHECK(near(decmath::atan(decmath::infinity<decimal34>(), angle_unit::radians), pi_ref / decimal34{2}, tol));
        CHECK(near(decmath::atan(-decmath::infinity<decimal34>(), angle_unit::radians), -pi_ref / decimal34{2}, tol));
        CHECK(near(decmath::atan(decimal34{1}, angle_unit::radians), pi_ref / decimal34{4}, tol));
        CHECK(near(decmath::atan(decimal34{-1}, angle_unit::degrees), decimal34{-45}, tol));
        CHECK(near(decmath::atan(num<decimal34>("0.5"), angle_unit::radians), num<decimal34>("0.4636476090008061162142562314612144020285"), tol));
        CHECK(near(decmath::atan(decimal34{3}, angle_unit::degrees), decimal34{90} - decmath::atan(num<decimal34>("1") / decimal34{3}, angle_unit::degrees), tol));
        CHECK(decmath::atan(decimal34{0}, angle_unit::radians) == decimal34{0});
        CHECK(decmath::is_nan(decmath::atan(decmath::nan<decimal34>())));

        CHECK(decmath::atan(0.7) == doctest::Approx(std::atan(0.7)));
    }

    TEST_CASE("atan2 special cases") {
        const decimal34 zero{0};
        const decimal34 one{1};
        const decimal34 inf = decmath::infinity<decimal34>();

        CHECK(near(decmath::atan2(one, one, angle_unit::radians), pi_ref / decimal34{4}, tol));
        CHECK(near(decmath::atan2(zero, -one, angle_unit::radians), pi_ref, tol));
        CHECK(decmath::atan2(zero, zero, angle_unit::radians) == zero);
        CHECK(decmath::atan2(zero, one, angle_unit::radians) == zero);
        CHECK(near(decmath::atan2(one, zero, angle_unit::radians), pi_ref / decimal34{2}, tol));
        CHECK(near(decmath::atan2(-one, zero, angle_unit::radians), -pi_ref / decimal34{2}, tol));
        CHECK(near(decmath::atan2(inf, inf, angle_unit::radians), pi_ref / decimal34{4}, tol));
        CHECK(near(decmath::atan2(inf, -inf, angle_unit::radians), pi_ref * decimal34{3} / decimal34{4}, tol));
        CHECK(near(decmath::atan2(-inf, -inf, angle_unit::radians), -pi_ref * decimal34{3} / decimal34{4}, tol));
        CHECK(near(decmath::atan2(one, -inf, angle_unit::radians), pi_ref, tol));
        CHECK(near(decmath::atan2(-one, -inf, angle_unit::radians), -pi_ref, tol));
        CHECK(decmath::atan2(one, inf, angle_unit::radians) == zero);
        CHECK(near(decmath::atan2(inf, one, angle_unit::radians), pi_ref / decimal34{2}, tol));
        CHECK(decmath::is_nan(decmath::atan2(decmath::nan<decimal34>(), one)));
        CHECK(decmath::is_nan(decmath::atan2(one, decmath::nan<decimal34>())));

        CHECK(near(decmath::atan2(-one, -one, angle_unit::degrees), decimal34{-135}, tol));
        CHECK(near(decmath::atan2(one, -one, angle_unit::degrees), decimal34{135}, tol));
    }

    TEST_CASE("atan2 keeps the sign of a zero ordinate") {
        CHECK(decmath::atan2(0.0, 0.0) == 0.0);
        CHECK_FALSE(std::signbit(decmath::atan2(0.0, 0.0)));
        CHECK(std::signbit(decmath::atan2(-0.0, 0.0)));
        CHECK(std::signbit(decmath::atan2(-0.0, 2.0)));
        CHECK(decmath::atan2(-0.0, -1.0) == doctest::Approx(-3.141592653589793));
        CHECK(decmath::atan2(2.0, -3.0) == doctest::Approx(std::atan2(2.0, -3.0)));
    }

    TEST_CASE("asin and acos") {
        CHECK(decmath::is_nan(decmath::asin(decimal34{2})));
        CHECK(decmath::is_nan(decmath::acos(decimal34{-2})));
        CHECK(decmath::acos(decimal34{1}) == decimal34{0});
        CHECK(near(decmath::acos(decimal34{-1}, angle_unit::radians), pi_ref, tol));
        CHECK(near(decmath::acos(decimal34{0}, angle_unit::degrees), decimal34{90}, tol));
        CHECK(near(decmath::acos(num<decimal34>("0.5"), angle_unit::radians), pi_ref / decimal34{3}, tol));
        CHECK(near(decmath::asin(decimal34{1}, angle_unit::radians), pi_ref / decimal34{2}, tol));
        CHECK(near(decmath::asin(num<decimal34>("-0.5"), angle_unit::degrees), decimal34{-30}, tol));

        CHECK(decmath::asin(0.3) == doctest::Approx(std::asin(0.3)));
        CHECK(decmath::acos(-0.3) == doctest::Approx(std::acos(-0.3)));
    }

    TEST_CASE("asin inverts sin on [-pi/2, pi/2]") {
        for (const char* s : {"-1.5", "-0.5", "0", "0.25", "1", "1.5"}) {
            CAPTURE(s);
            const decimal34 x = num<decimal34>(s);
            const decimal34 y = decmath::asin(decmath::sin(x, angle_unit::radians), angle_unit::radians);
            CHECK(near(y, x, num<decimal34>("1e-29")));
        }
    }
}
