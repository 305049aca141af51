#pragma once

#include <type_traits>

#include "tagcache/cli/options.hpp"
#include "tagcache/core/errors.hpp"

namespace tagcache::cli {
    using u32 = tagcache::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Classify = 2,
        Tables = 3,
        Deps = 4,
        Invalidate = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* alias{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against names and aliases; args of the invocation are
    // the remaining arguments.
    tagcache::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);

} // namespace tagcache::cli
