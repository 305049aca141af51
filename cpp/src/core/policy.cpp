#include "tagcache/core/policy.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace tagcache::core {
    namespace {
        [[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                const auto ca = static_cast<unsigned char>(a[i]);
                const auto cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb)) {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    CachePolicy policy_with_dependencies(std::initializer_list<std::string_view> tags) {
        CachePolicy p{};
        for (std::string_view t : tags) {
            if (!t.empty()) {
                p.explicit_dependencies.emplace(t);
            }
        }
        return p;
    }

    bool parse_log_level(std::string_view name, LogLevel* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        if (iequals(name, "debug")) {
            *out = LogLevel::Debug;
        } else if (iequals(name, "info")) {
            *out = LogLevel::Info;
        } else if (iequals(name, "warning") || iequals(name, "warn")) {
            *out = LogLevel::Warning;
        } else if (iequals(name, "error")) {
            *out = LogLevel::Error;
        } else {
            return false;
        }
        return true;
    }

    CacheSettings settings_from_env() noexcept {
        CacheSettings s{};

        const char* disable = std::getenv("TAGCACHE_DISABLE_LOGGING");
        if (disable != nullptr && disable[0] != '\0') {
            s.disable_logging = iequals(disable, "1") || iequals(disable, "true");
        }

        const char* level = std::getenv("TAGCACHE_LOG_LEVEL");
        if (level != nullptr && level[0] != '\0') {
            LogLevel parsed{};
            if (parse_log_level(level, &parsed)) {
                s.log_level = parsed;
            }
        }
        return s;
    }
} // namespace tagcache::core
