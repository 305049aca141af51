#include "tagcache/catalog/enumerator.hpp"

#include <string>
#include <utility>

namespace tagcache::catalog {

using namespace tagcache::core;

void StaticSchemaEnumerator::add_schema(SchemaOwnerId owner, std::initializer_list<std::string_view> tables) {
    ResourceSet names;
    for (std::string_view t : tables) {
        if (!t.empty()) {
            names.emplace(t);
        }
    }
    add_schema(owner, std::move(names));
}

void StaticSchemaEnumerator::add_schema(SchemaOwnerId owner, ResourceSet tables) {
    std::lock_guard<std::mutex> lock(mutex_);
    schemas_[owner.v] = std::move(tables);
}

Status StaticSchemaEnumerator::enumerate(SchemaOwnerId owner, ResourceSet* out) {
    if (out == nullptr || !owner.is_valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = schemas_.find(owner.v);
    if (it == schemas_.end()) {
        return make_status(StatusDomain::Catalog, StatusCode::NotFound, owner.v);
    }

    *out = it->second;
    enumerations_.fetch_add(1, std::memory_order_relaxed);
    return ok_status();
}

} // namespace tagcache::catalog
