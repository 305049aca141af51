#pragma once

#include <string>
#include <string_view>

#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::storage {
    // BLAKE3 of raw bytes.
    core::Status hash_compute(const void* data, std::size_t len, core::Hash256* out) noexcept;

    // Cache key of a read: owner, command text and bound parameter text.
    // Fields are length-prefixed so ("ab", "c") and ("a", "bc") differ.
    core::Status cache_key_compute(core::SchemaOwnerId owner,
                                   std::string_view command_text,
                                   std::string_view parameters,
                                   core::Hash256* out) noexcept;

    [[nodiscard]] std::string cache_key_hex(const core::Hash256& key);

} // namespace tagcache::storage
