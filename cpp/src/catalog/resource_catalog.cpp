#include "tagcache/catalog/resource_catalog.hpp"

#include <utility>
#include <vector>

#include "tagcache/core/log.hpp"

namespace tagcache::catalog {

using namespace tagcache::core;

ResourceCatalog::ResourceCatalog(SchemaEnumerator& enumerator, std::shared_ptr<spdlog::logger> logger)
    : enumerator_(enumerator),
      logger_(logger ? std::move(logger) : default_logger()) {}

std::shared_ptr<ResourceCatalog::Slot> ResourceCatalog::slot_for(SchemaOwnerId owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[owner.v];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

void ResourceCatalog::release_slot(SchemaOwnerId owner, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = slots_.find(owner.v);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
}

Status ResourceCatalog::resolve_resource_names(SchemaOwnerId owner,
                                               std::shared_ptr<const ResourceSet>* out) {
    if (out == nullptr || !owner.is_valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    const std::shared_ptr<Slot> slot = slot_for(owner);

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->names) {
        *out = slot->names;
        return ok_status();
    }

    ResourceSet names;
    const Status s = enumerator_.enumerate(owner, &names);
    if (!is_ok(s)) {
        logger_->error("Failed to enumerate tables of schema owner {} ({}/{}, aux={})",
                       owner.v, status_domain_name(s.domain), status_code_name(s.code), s.aux);
        release_slot(owner, slot);
        return s;
    }

    slot->names = std::make_shared<const ResourceSet>(std::move(names));
    *out = slot->names;
    return ok_status();
}

bool ResourceCatalog::contains(SchemaOwnerId owner) const {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = slots_.find(owner.v);
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->names != nullptr;
}

std::size_t ResourceCatalog::size() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::size_t n = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->names) {
            ++n;
        }
    }
    return n;
}

std::size_t ResourceCatalog::slot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace tagcache::catalog
