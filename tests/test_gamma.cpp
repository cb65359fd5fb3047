#include "decimal.hpp"
#include "doctest.h"
#include "gamma.hpp"
#include "tolerance.hpp"

using decmath::decimal34;
using decmath::test::near;
using decmath::test::num;

TEST_SUITE("gamma") {
    TEST_CASE("integer arguments take the exact product") {
        CHECK(decmath::gamma(decimal34{5}) == decimal34{24});
        CHECK(decmath::gamma(decimal34{1}) == decimal34{1});
        CHECK(decmath::gamma(decimal34{2}) == decimal34{1});
        CHECK(decmath::factorial(decimal34{5}) == decimal34{120});
        CHECK(decmath::factorial(decimal34{0}) == decimal34{1});
        CHECK(decmath::factorial(decimal34{20}) == num<decimal34>("2432902008176640000"));

        CHECK(decmath::gamma(5.0) == 24.0);
        CHECK(decmath::factorial(10.0) == 3628800.0);
    }

    TEST_CASE("combinatorics") {
        CHECK(decmath::combination(decimal34{5}, decimal34{2}) == decimal34{10});
        CHECK(decmath::permutation(decimal34{5}, decimal34{2}) == decimal34{20});
        CHECK(decmath::combination(decimal34{10}, decimal34{3}) == decimal34{120});
        CHECK(decmath::permutation(decimal34{10}, decimal34{3}) == decimal34{720});
        CHECK(decmath::combination(decimal34{52}, decimal34{5}) == decimal34{2598960});
        CHECK(decmath::combination(decimal34{7}, decimal34{0}) == decimal34{1});
        CHECK(decmath::combination(decimal34{7}, decimal34{7}) == decimal34{1});
        CHECK(decmath::is_nan(decmath::permutation(decimal34{5}, decimal34{7})));

        CHECK(decmath::combination(5.0, 2.0) == 10.0);
        CHECK(decmath::permutation(5.0, 2.0) == 20.0);
    }

    TEST_CASE("non-integer arguments") {
        const decimal34 tol = num<decimal34>("1e-30");
        const decimal34 root_pi = num<decimal34>("1.772453850905516027298167483341145183");

        CHECK(near(decmath::gamma(num<decimal34>("0.5")), root_pi, tol));
        CHECK(near(decmath::gamma(num<decimal34>("1.5")), root_pi / decimal34{2}, tol));
        CHECK(near(decmath::gamma(num<decimal34>("4.5")), num<decimal34>("11.63172839656744892914422410942626526"), tol));
        CHECK(near(decmath::factorial(num<decimal34>("3.5")), num<decimal34>("11.63172839656744892914422410942626526"), tol));
    }

    TEST_CASE("reflection below one half") {
        const decimal34 tol = num<decimal34>("1e-30");
        const decimal34 root_pi = num<decimal34>("1.772453850905516027298167483341145183");

        CHECK(near(decmath::gamma(num<decimal34>("-0.5")), root_pi * decimal34{-2}, tol));
        CHECK(near(decmath::gamma(num<decimal34>("0.25")), num<decimal34>("3.625609908221908311930685155867672002"), tol));
        CHECK(near(decmath::gamma(num<decimal34>("-1.5")), root_pi * decimal34{4} / decimal34{3}, tol));
    }

    TEST_CASE("reflection ignores the default angle unit") {
        const decimal34 tol = num<decimal34>("1e-30");
        const decmath::angle_unit saved = decmath::default_angle_unit();
        decmath::set_default_angle_unit(decmath::angle_unit::degrees);
        CHECK(near(decmath::gamma(num<decimal34>("-0.5")), num<decimal34>("-3.544907701811032054596334966682290366"), tol));
        decmath::set_default_angle_unit(saved);
    }

    TEST_CASE("domain") {
        CHECK(decmath::is_nan(decmath::gamma(decimal34{0})));
        CHECK(decmath::is_nan(decmath::gamma(decimal34{-3})));
        CHECK(decmath::is_nan(decmath::gamma(decmath::nan<decimal34>())));
        CHECK(decmath::is_nan(decmath::gamma(-decmath::infinity<decimal34>())));
        CHECK(decmath::gamma(num<decimal34>("1e9")) == decmath::infinity<decimal34>());
        CHECK(decmath::gamma(num<decimal34>("-1e9")) == decmath::infinity<decimal34>());
        CHECK(decmath::gamma(decmath::infinity<decimal34>()) == decmath::infinity<decimal34>());
        CHECK(decmath::is_nan(decmath::factorial(decimal34{-1})));
    }
}
