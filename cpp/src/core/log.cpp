#include "tagcache/core/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tagcache::core {

    spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warning: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
        }
        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> default_logger() {
        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        auto logger = spdlog::get(kLoggerName);
        if (!logger) {
            logger = spdlog::stderr_color_mt(kLoggerName);
        }
        return logger;
    }

    void init_logging(LogLevel level) {
        const auto spdlog_level = to_spdlog_level(level);
        default_logger()->set_level(spdlog_level);
        default_logger()->debug("Logger set up to: {} level", spdlog::level::to_short_c_str(spdlog_level));
    }

} // namespace tagcache::core
