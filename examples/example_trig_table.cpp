#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "decmath.hpp"

int main() {
    using decmath::angle_unit;
    using decmath::decimal34;

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%l] %v");

    // Whole degrees from 0 to 360 in steps of 15
    fmt::print("{:>5} | sin | cos\n", "deg");
    for (int d = 0; d <= 360; d += 15) {
        const decimal34 x{d};
        const decimal34 s = decmath::sin(x, angle_unit::degrees);
        const decimal34 c = decmath::cos(x, angle_unit::degrees);
        fmt::print("{:>5} | {} | {}\n", d, s, c);
    }

    // The same angle in every unit
    const decmath::angle<decimal34> quarter_deg{decimal34{90}, angle_unit::degrees};
    const decmath::angle<decimal34> quarter_grad{decimal34{100}, angle_unit::gradians};
    const decmath::angle<decimal34> quarter_rad{decmath::half_pi<decimal34>(), angle_unit::radians};
    fmt::print("\nsin(90 deg) = {}\nsin(100 grad) = {}\nsin(pi/2 rad) = {}\n", decmath::sin(quarter_deg),
               decmath::sin(quarter_grad), decmath::sin(quarter_rad));

    // Inverse functions follow the default unit
    decmath::set_default_angle_unit(angle_unit::degrees);
    fmt::print("\natan(1) = {} deg\n", decmath::atan(decimal34{1}));
    fmt::print("atan2(-1, -1) = {} deg\n", decmath::atan2(decimal34{-1}, decimal34{-1}));
    fmt::print("asin(0.5) = {} deg\n", decmath::asin(decmath::real_traits<decimal34>::from_string("0.5").value()));

    // tan of a right angle has no value
    const decimal34 t = decmath::tan(decimal34{90});
    if (decmath::is_nan(t)) {
        spdlog::warn("tan(90 deg) is undefined");
    }

    return 0;
}
