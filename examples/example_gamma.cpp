#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "decmath.hpp"

int main() {
    using decmath::decimal34;
    using decmath::decimal50;

    // Domain rejections are logged at debug level
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%n] [%l] %v");

    const auto half = decmath::real_traits<decimal50>::from_string("0.5").value();

    fmt::print("gamma(0.5)^2 = {}\n", decmath::sqr(decmath::gamma(half)));
    fmt::print("pi           = {}\n", decmath::pi<decimal50>());

    for (int n = 0; n <= 25; n += 5) {
        fmt::print("{:>2}! = {}\n", n, decmath::factorial(decimal34{n}));
    }

    fmt::print("\n52 choose 5  = {}\n", decmath::combination(decimal34{52}, decimal34{5}));
    fmt::print("10 permute 3 = {}\n", decmath::permutation(decimal34{10}, decimal34{3}));

    // Reflection for arguments below one half
    for (const char* s : {"-0.5", "-1.5", "-2.5", "0.25"}) {
        const auto t = decmath::real_traits<decimal34>::from_string(s).value();
        fmt::print("gamma({}) = {}\n", s, decmath::gamma(t));
    }

    // Poles
    const decimal34 pole = decmath::gamma(decimal34{-2});
    fmt::print("gamma(-2) = {}\n", pole);

    return 0;
}
