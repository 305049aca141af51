#pragma once

#include <initializer_list>
#include <string_view>

#include "tagcache/core/types.hpp"

namespace tagcache::core {

    enum class ExpirationMode : u8 {
        Absolute = 0,
        Sliding = 1,
    };

    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3,
    };

    // Per-query caching options. Owned by the caller.
    struct CachePolicy {
        TagSet explicit_dependencies{};
        ExpirationMode expiration{ExpirationMode::Absolute};
        u64 timeout_ms{0};                // 0 = never expires
        bool log_resolution{true};
    };

    [[nodiscard]] CachePolicy policy_with_dependencies(std::initializer_list<std::string_view> tags);

    // Process-wide engine settings.
    struct CacheSettings {
        bool disable_logging{false};
        LogLevel log_level{LogLevel::Info};
    };

    // Reads TAGCACHE_DISABLE_LOGGING ("1"/"true") and TAGCACHE_LOG_LEVEL
    // ("debug", "info", "warning", "error"). Unset or unrecognized values
    // keep the defaults.
    [[nodiscard]] CacheSettings settings_from_env() noexcept;

    [[nodiscard]] bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

} // namespace tagcache::core
