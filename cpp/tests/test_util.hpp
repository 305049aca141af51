#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"
#include "tagcache/storage/cache_store.hpp"

namespace tagcache::test {

    // Debug-level logger writing "[level] message" lines into a string.
    struct CapturedLog {
        std::ostringstream stream;
        std::shared_ptr<spdlog::logger> logger;

        CapturedLog() {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
            sink->set_pattern("[%l] %v");
            logger = std::make_shared<spdlog::logger>("captured", sink);
            logger->set_level(spdlog::level::debug);
        }

        [[nodiscard]] std::string text() {
            logger->flush();
            return stream.str();
        }
    };

    // Records every purge request; answers with a configurable status.
    class RecordingStore final : public storage::CacheStore {
    public:
        core::Status invalidate_by_dependency_tags(const core::TagSet& tags) override {
            ++calls;
            last_tags = tags;
            return result;
        }

        int calls{0};
        core::TagSet last_tags{};
        core::Status result{};
    };

} // namespace tagcache::test
