#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "tagcache/core/policy.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::deps {

    // Maps a command to the dependency tags of its cache entry.
    //
    // Tables named after FROM/JOIN/INTO/UPDATE that are also known to the
    // schema win. Otherwise the policy's explicit dependencies are used, and
    // failing those the single tag kUnknownDependency. The result is never
    // empty.
    class DependencyResolver {
    public:
        explicit DependencyResolver(core::CacheSettings settings = {},
                                    std::shared_ptr<spdlog::logger> logger = nullptr);

        [[nodiscard]] core::TagSet resolve(const core::CachePolicy& policy,
                                           const core::ResourceSet& known_resources,
                                           std::string_view command_text) const;

        [[nodiscard]] bool logging_enabled(const core::CachePolicy& policy) const noexcept {
            return !settings_.disable_logging && policy.log_resolution;
        }

        [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

    private:
        core::CacheSettings settings_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace tagcache::deps
