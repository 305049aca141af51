#include "tagcache/storage/memory_store.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>
#include <vector>

namespace tagcache::storage {

using namespace tagcache::core;

namespace {

// now + timeout, saturating at the largest Timestamp.
Timestamp deadline_after(Timestamp now, u64 timeout_ms) noexcept {
    constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
    const Timestamp timeout = timeout_ms > static_cast<u64>(kMax) ? kMax : static_cast<Timestamp>(timeout_ms);
    if (now > kMax - timeout) {
        return kMax;
    }
    return now + timeout;
}

} // namespace

Timestamp steady_now_ms() noexcept {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

MemoryCacheStore::MemoryCacheStore(ClockFn clock) noexcept
    : clock_(clock != nullptr ? clock : &steady_now_ms) {}

void MemoryCacheStore::erase_locked(std::map<Hash256, Entry>::iterator it) {
    for (const auto& tag : it->second.tags) {
        const auto idx = tag_index_.find(tag);
        if (idx == tag_index_.end()) {
            continue;
        }
        idx->second.erase(it->first);
        if (idx->second.empty()) {
            tag_index_.erase(idx);
        }
    }
    entries_.erase(it);
}

void MemoryCacheStore::sweep_expired_locked(Timestamp now) {
    if (next_sweep_at_ == 0 || now < next_sweep_at_) {
        return;
    }

    Timestamp earliest = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const Timestamp at = it->second.expires_at;
        if (at != 0 && now >= at) {
            const auto doomed = it++;
            erase_locked(doomed);
            continue;
        }
        if (at != 0) {
            earliest = earliest == 0 ? at : std::min(earliest, at);
        }
        ++it;
    }
    next_sweep_at_ = earliest;
}

Status MemoryCacheStore::put(const Hash256& key,
                             std::string value,
                             const TagSet& tags,
                             const CachePolicy& policy) {
    if (tags.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_();
    sweep_expired_locked(now);

    const auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        erase_locked(existing);
    }

    Entry e{};
    e.value = std::move(value);
    e.tags = tags;
    e.expiration = policy.expiration;
    e.timeout_ms = policy.timeout_ms;
    e.expires_at = policy.timeout_ms == 0 ? 0 : deadline_after(now, policy.timeout_ms);
    if (e.expires_at != 0) {
        next_sweep_at_ = next_sweep_at_ == 0 ? e.expires_at : std::min(next_sweep_at_, e.expires_at);
    }

    for (const auto& tag : e.tags) {
        tag_index_[tag].insert(key);
    }
    entries_.emplace(key, std::move(e));
    return ok_status();
}

Status MemoryCacheStore::get(const Hash256& key, std::string* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    Entry& e = it->second;
    const Timestamp now = clock_();
    if (e.expires_at != 0 && now >= e.expires_at) {
        erase_locked(it);
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    if (e.expiration == ExpirationMode::Sliding && e.timeout_ms != 0) {
        e.expires_at = deadline_after(now, e.timeout_ms);
    }

    *out = e.value;
    return ok_status();
}

Status MemoryCacheStore::invalidate_by_dependency_tags(const TagSet& tags) {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_expired_locked(clock_());

    std::vector<Hash256> doomed;
    for (const auto& tag : tags) {
        const auto idx = tag_index_.find(tag);
        if (idx == tag_index_.end()) {
            continue;
        }
        doomed.insert(doomed.end(), idx->second.begin(), idx->second.end());
    }

    for (const Hash256& key : doomed) {
        const auto it = entries_.find(key);
        if (it != entries_.end()) {
            erase_locked(it);
        }
    }
    return ok_status();
}

void MemoryCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    tag_index_.clear();
    next_sweep_at_ = 0;
}

std::size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t MemoryCacheStore::tagged_count(std::string_view tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto idx = tag_index_.find(tag);
    return idx == tag_index_.end() ? 0 : idx->second.size();
}

} // namespace tagcache::storage
