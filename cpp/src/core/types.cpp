#include "tagcache/core/types.hpp"

namespace tagcache::core {
    std::string join_names(const std::set<std::string, std::less<>>& names) {
        std::string out;
        for (const auto& n : names) {
            if (!out.empty()) {
                out += ", ";
            }
            out += n;
        }
        return out;
    }
} // namespace tagcache::core
