#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

#include "tagcache/core/errors.hpp"
#include "tagcache/core/policy.hpp"
#include "tagcache/core/types.hpp"
#include "tagcache/storage/cache_store.hpp"

namespace tagcache::storage {

using ClockFn = core::Timestamp (*)() noexcept;

// steady_clock in milliseconds
[[nodiscard]] core::Timestamp steady_now_ms() noexcept;

// In-process cache keyed by Hash256 (see cache_key_compute) with a
// tag -> keys index for bulk invalidation.
//
// Expiration follows the entry's CachePolicy: Absolute entries expire
// timeout_ms after put, Sliding entries timeout_ms after the last get.
// Expired entries are dropped when read, and swept by put and
// invalidate_by_dependency_tags once the earliest deadline has passed.
// Timeouts too large for a Timestamp saturate (the entry never expires).
class MemoryCacheStore final : public CacheStore {
public:
    explicit MemoryCacheStore(ClockFn clock = &steady_now_ms) noexcept;

    // Replaces an existing entry under the same key. `tags` must not be empty.
    [[nodiscard]] core::Status put(const core::Hash256& key,
                                   std::string value,
                                   const core::TagSet& tags,
                                   const core::CachePolicy& policy);

    // NotFound on a miss or an expired entry.
    [[nodiscard]] core::Status get(const core::Hash256& key, std::string* out);

    [[nodiscard]] core::Status invalidate_by_dependency_tags(const core::TagSet& tags) override;

    void clear();

    [[nodiscard]] std::size_t size() const;

    // Keys currently indexed under `tag`.
    [[nodiscard]] std::size_t tagged_count(std::string_view tag) const;

private:
    struct Entry {
        std::string value;
        core::TagSet tags;
        core::ExpirationMode expiration{core::ExpirationMode::Absolute};
        core::u64 timeout_ms{0};
        core::Timestamp expires_at{0};    // 0 = never
    };

    void erase_locked(std::map<core::Hash256, Entry>::iterator it);
    void sweep_expired_locked(core::Timestamp now);

    ClockFn clock_;
    mutable std::mutex mutex_;
    std::map<core::Hash256, Entry> entries_;
    std::map<std::string, std::set<core::Hash256>, std::less<>> tag_index_;
    core::Timestamp next_sweep_at_{0};    // earliest known deadline, 0 = none
};

} // namespace tagcache::storage
