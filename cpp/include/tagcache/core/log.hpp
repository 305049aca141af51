#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "tagcache/core/policy.hpp"

namespace tagcache::core {

    inline constexpr const char* kLoggerName = "tagcache";

    // Shared "tagcache" logger (stderr, colored). Created on first use and
    // registered with spdlog.
    [[nodiscard]] std::shared_ptr<spdlog::logger> default_logger();

    // Sets the level of the default logger.
    void init_logging(LogLevel level);

    [[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

} // namespace tagcache::core
