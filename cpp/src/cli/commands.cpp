#include "tagcache/cli/commands.hpp"

#include <cstring>

namespace tagcache::cli {
    namespace {
        [[nodiscard]] bool name_matches(const char* name, const char* cmd) noexcept {
            return name != nullptr && std::strcmp(name, cmd) == 0;
        }
    } // namespace

    tagcache::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const auto invalid = tagcache::core::make_status(tagcache::core::StatusDomain::Cli,
                                                         tagcache::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return invalid;
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid;
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid;
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return invalid;
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (name_matches(s.name, cmd) || name_matches(s.alias, cmd)) {
                out->id = s.id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return tagcache::core::ok_status();
            }
        }
        return invalid;
    }
} // namespace tagcache::cli
