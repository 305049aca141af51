#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tagcache/core/types.hpp"

namespace tagcache::text {

    // Splits on spaces, tabs and line breaks. Empty tokens are dropped.
    [[nodiscard]] std::vector<std::string_view> split_tokens(std::string_view text);

    // "schema.table" -> "table", "[dbo].[Products]" -> "Products".
    // Only the second dot segment is ever taken, so "a.b.c" -> "b".
    // Returns an empty string when nothing is left.
    [[nodiscard]] std::string normalize_identifier(std::string_view token);

    // Identifiers following FROM, JOIN, INTO and UPDATE, normalized.
    // Best effort: never fails, may return an empty set.
    [[nodiscard]] core::ResourceSet extract_candidate_identifiers(std::string_view text);

} // namespace tagcache::text
