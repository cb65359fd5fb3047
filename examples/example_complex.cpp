#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "decmath.hpp"

int main(int argc, char** argv) {
    using Complex = decmath::complex<decmath::decimal34>;

    spdlog::set_pattern("[%l] %v");

    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i) {
        inputs.emplace_back(argv[i]);
    }
    if (inputs.empty()) {
        inputs = {"3+4i", "-1", "i", "1e-5-2i", "0.5+0.25i"};
    }

    for (const auto& text : inputs) {
        const auto parsed = decmath::parse_complex<decmath::decimal34>(text);
        if (!parsed) {
            spdlog::error("'{}' is not a complex number", text);
            continue;
        }
        const Complex z = *parsed;

        fmt::print("z        = {}\n", z);
        fmt::print("|z|      = {}\n", z.abs());
        fmt::print("arg z    = {}\n", z.arg());
        fmt::print("sqrt z   = {}\n", decmath::sqrt(z));
        fmt::print("cbrt z   = {}\n", decmath::cbrt(z));
        fmt::print("exp z    = {}\n", decmath::exp(z));
        fmt::print("ln z     = {}\n", decmath::ln(z));
        fmt::print("z^5      = {}\n", decmath::ipow(z, 5));
        fmt::print("sin z    = {}\n", decmath::sin(z));
        fmt::print("asinh z  = {}\n\n", decmath::asinh(z));
    }

    const Complex i{decmath::decimal34{0}, decmath::decimal34{1}};
    fmt::print("i^i = {}\n", decmath::pow(i, i));

    return 0;
}
