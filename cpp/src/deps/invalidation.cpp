#include "tagcache/deps/invalidation.hpp"

#include <utility>

#include "tagcache/text/classifier.hpp"

namespace tagcache::deps {

using namespace tagcache::core;

InvalidationCoordinator::InvalidationCoordinator(catalog::ResourceCatalog& catalog,
                                                 CacheSettings settings,
                                                 std::shared_ptr<spdlog::logger> logger)
    : catalog_(catalog),
      resolver_(settings, std::move(logger)) {}

Status InvalidationCoordinator::resolve_read_dependencies(const CachePolicy& policy,
                                                          SchemaOwnerId owner,
                                                          std::string_view command_text,
                                                          TagSet* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Resolver, StatusCode::Invalid);
    }

    std::shared_ptr<const ResourceSet> known;
    const Status s = catalog_.resolve_resource_names(owner, &known);
    if (!is_ok(s)) {
        return s;
    }

    *out = resolver_.resolve(policy, *known, command_text);
    return ok_status();
}

Status InvalidationCoordinator::invalidation_tags(std::string_view command_text,
                                                  SchemaOwnerId owner,
                                                  const CachePolicy& policy,
                                                  TagSet* out) {
    if (out == nullptr) {
        return make_status(StatusDomain::Invalidation, StatusCode::Invalid);
    }
    out->clear();

    if (!text::is_mutating_command(command_text)) {
        return ok_status();
    }

    TagSet deps;
    const Status s = resolve_read_dependencies(policy, owner, command_text, &deps);
    if (!is_ok(s)) {
        return s;
    }
    // Reads that could not be tied to a table are tagged with the sentinel;
    // any write may have touched them.
    deps.emplace(kUnknownDependency);

    *out = std::move(deps);
    return ok_status();
}

Status InvalidationCoordinator::invalidate_if_mutating(std::string_view command_text,
                                                       SchemaOwnerId owner,
                                                       const CachePolicy& policy,
                                                       storage::CacheStore& store,
                                                       bool* invalidated) {
    if (invalidated == nullptr) {
        return make_status(StatusDomain::Invalidation, StatusCode::Invalid);
    }
    *invalidated = false;

    TagSet deps;
    Status s = invalidation_tags(command_text, owner, policy, &deps);
    if (!is_ok(s) || deps.empty()) {
        return s;
    }

    s = store.invalidate_by_dependency_tags(deps);
    if (!is_ok(s)) {
        resolver_.logger()->error("Failed to invalidate [{}] dependencies ({}/{})",
                                  join_names(deps), status_domain_name(s.domain), status_code_name(s.code));
        return s;
    }

    if (resolver_.logging_enabled(policy)) {
        resolver_.logger()->debug("Invalidated [{}] dependencies.", join_names(deps));
    }
    *invalidated = true;
    return ok_status();
}

} // namespace tagcache::deps
