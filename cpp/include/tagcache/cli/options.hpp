#pragma once

#include <type_traits>

#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::cli {
    using u8 = tagcache::core::u8;
    using u32 = tagcache::core::u32;
    using i64 = tagcache::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Db = 1,         // --db <path>
        Dependency = 2, // --dep <tag>, repeatable
        Owner = 3,      // --owner <id>
        Quiet = 4,      // --quiet
        Verbose = 5,    // --verbose
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options never allocates.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options ("--name value", "--name=value", "-n value",
    // "-nvalue") up to the first positional argument or "--".
    // *consumed is the index of the first unparsed argument.
    tagcache::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of `id`, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    [[nodiscard]] bool has_flag(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);

} // namespace tagcache::cli
