#include "tagcache/deps/resolver.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include "tagcache/core/log.hpp"
#include "tagcache/text/tokens.hpp"

namespace tagcache::deps {

using namespace tagcache::core;

DependencyResolver::DependencyResolver(CacheSettings settings, std::shared_ptr<spdlog::logger> logger)
    : settings_(settings),
      logger_(logger ? std::move(logger) : default_logger()) {}

TagSet DependencyResolver::resolve(const CachePolicy& policy,
                                   const ResourceSet& known_resources,
                                   std::string_view command_text) const {
    const ResourceSet candidates = text::extract_candidate_identifiers(command_text);

    TagSet deps;
    std::set_intersection(known_resources.begin(), known_resources.end(),
                          candidates.begin(), candidates.end(),
                          std::inserter(deps, deps.end()));

    if (deps.empty()) {
        deps = policy.explicit_dependencies;
    }
    if (deps.empty()) {
        if (logging_enabled(policy)) {
            logger_->debug("Could not determine the tables of command [{}]. "
                           "Declare them with CachePolicy::explicit_dependencies.",
                           command_text);
        }
        deps.emplace(kUnknownDependency);
    }

    if (logging_enabled(policy)) {
        logger_->debug("known: {}; candidates: {} -> dependencies: {}",
                       join_names(known_resources), join_names(candidates), join_names(deps));
    }
    return deps;
}

} // namespace tagcache::deps
