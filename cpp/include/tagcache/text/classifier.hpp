#pragma once

#include <string_view>

namespace tagcache::text {

    // True if any line of the command, after trimming, starts with
    // "insert ", "update ", "delete " or "create " (case-insensitive).
    // The verb has to lead a line; statements formatted otherwise are
    // reported as reads.
    [[nodiscard]] bool is_mutating_command(std::string_view text) noexcept;

    // Null is a read.
    [[nodiscard]] bool is_mutating_command(const char* text) noexcept;

} // namespace tagcache::text
