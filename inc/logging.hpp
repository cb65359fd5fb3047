#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace decmath {

/**
 * @brief Library logger
 *
 * A named "decmath" logger writing to stderr. Created on first use; an
 * application that registers its own logger under the same name before the
 * first call gets that one instead. Level and pattern follow the global spdlog
 * settings unless changed through the returned pointer.
 *
 * @return Shared pointer to the library logger
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("decmath")) {
            return existing;
        }
        return spdlog::stderr_color_mt("decmath");
    }();
    return instance;
}

} // namespace decmath
