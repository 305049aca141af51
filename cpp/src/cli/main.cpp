#include <array>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "tagcache/catalog/resource_catalog.hpp"
#include "tagcache/cli/commands.hpp"
#include "tagcache/cli/options.hpp"
#include "tagcache/core/errors.hpp"
#include "tagcache/core/log.hpp"
#include "tagcache/core/policy.hpp"
#include "tagcache/db/sqlite_schema.hpp"
#include "tagcache/deps/invalidation.hpp"
#include "tagcache/text/classifier.hpp"

namespace {

using tagcache::cli::CommandId;
using tagcache::cli::OptionId;
using tagcache::cli::OptionType;

constexpr std::array<tagcache::cli::CommandSpec, 5> g_commands = {{
    {CommandId::Help, "help", "h"},
    {CommandId::Classify, "classify", "c"},
    {CommandId::Tables, "tables", "t"},
    {CommandId::Deps, "deps", "d"},
    {CommandId::Invalidate, "invalidate", "i"},
}};

constexpr std::array<tagcache::cli::OptionSpec, 5> g_options = {{
    {OptionId::Db, OptionType::String, "db", 'd'},
    {OptionId::Dependency, OptionType::String, "dep", 'D'},
    {OptionId::Owner, OptionType::I64, "owner", 'o'},
    {OptionId::Quiet, OptionType::Flag, "quiet", 'q'},
    {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
}};

constexpr tagcache::core::u32 kMaxOptions = 64;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string db_path;
    tagcache::core::SchemaOwnerId owner{1};
    tagcache::core::CachePolicy policy{};
    tagcache::core::CacheSettings settings{};
    std::string command_text;
};

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    std::fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, tagcache::core::Status s) {
    std::fprintf(stderr, "error: %s failed (code=%s, domain=%s, aux=%u)\n",
                 context,
                 tagcache::core::status_code_name(s.code),
                 tagcache::core::status_domain_name(s.domain),
                 s.aux);
}

void print_tags(const tagcache::core::TagSet& tags) {
    for (const auto& t : tags) {
        std::printf("%s\n", t.c_str());
    }
}

void handle_help() {
    std::printf("usage: tagcache <command> [options] [sql...]\n\n");
    std::printf("Commands:\n");
    std::printf("  classify <sql>                      Print 'mutating' or 'read'\n");
    std::printf("  tables --db <path>                  List the tables of a SQLite database\n");
    std::printf("  deps --db <path> [--dep T].. <sql>  Dependency tags of a read\n");
    std::printf("  invalidate --db <path> [--dep T].. <sql>\n");
    std::printf("                                      Tags a write would purge (dry run)\n");
    std::printf("  help                                Show this help\n\n");
    std::printf("Options:\n");
    std::printf("  -d, --db <path>     SQLite database providing the table names\n");
    std::printf("  -D, --dep <tag>     Explicit dependency used when no table matches\n");
    std::printf("  -o, --owner <id>    Schema owner id (default 1)\n");
    std::printf("  -q, --quiet         Disable diagnostic logging\n");
    std::printf("  -v, --verbose       Log dependency resolution\n");
}

// Options, then the remaining arguments joined as the command text.
tagcache::core::Status load_config(const tagcache::cli::CliArgs& args, CliConfig* cfg) {
    std::array<tagcache::cli::ParsedOption, kMaxOptions> storage{};
    tagcache::cli::ParsedOptions opts{storage.data(), 0, kMaxOptions};
    tagcache::core::u32 consumed = 0;

    const tagcache::core::Status s = tagcache::cli::parse_options(
        args, g_options.data(), static_cast<tagcache::core::u32>(g_options.size()), &opts, &consumed);
    if (!tagcache::core::is_ok(s)) {
        return s;
    }

    for (tagcache::core::u32 i = 0; i < opts.len; ++i) {
        const tagcache::cli::ParsedOption& o = opts.data[i];
        switch (o.id) {
            case OptionId::Db:
                cfg->db_path = o.value.str;
                break;
            case OptionId::Dependency:
                if (o.value.str[0] != '\0') {
                    cfg->policy.explicit_dependencies.emplace(o.value.str);
                }
                break;
            case OptionId::Owner:
                if (o.value.i64v < 0 || o.value.i64v >= 0xffffffffLL) {
                    return tagcache::core::make_status(tagcache::core::StatusDomain::Cli,
                                                       tagcache::core::StatusCode::Invalid);
                }
                cfg->owner = tagcache::core::SchemaOwnerId{static_cast<tagcache::core::u32>(o.value.i64v)};
                break;
            case OptionId::Quiet:
                cfg->settings.disable_logging = true;
                break;
            case OptionId::Verbose:
                cfg->settings.log_level = tagcache::core::LogLevel::Debug;
                break;
            case OptionId::None:
                break;
        }
    }

    for (tagcache::core::u32 i = consumed; i < args.argc; ++i) {
        if (!cfg->command_text.empty()) {
            cfg->command_text += ' ';
        }
        cfg->command_text += args.argv[i];
    }
    return tagcache::core::ok_status();
}

int handle_classify(const CliConfig& cfg) {
    if (cfg.command_text.empty()) {
        print_error("classify: missing command text");
        return EXIT_FAILURE;
    }
    std::printf("%s\n", tagcache::text::is_mutating_command(cfg.command_text) ? "mutating" : "read");
    return EXIT_SUCCESS;
}

int handle_tables(const CliConfig& cfg) {
    if (cfg.db_path.empty()) {
        print_error("tables: --db is required");
        return EXIT_FAILURE;
    }
    tagcache::core::ResourceSet tables;
    const tagcache::core::Status s = tagcache::db::sqlite_list_tables(cfg.db_path.c_str(), &tables);
    if (!tagcache::core::is_ok(s)) {
        print_status_error("tables", s);
        return EXIT_FAILURE;
    }
    print_tags(tables);
    return EXIT_SUCCESS;
}

int handle_resolve(const CliConfig& cfg, CommandId id) {
    const char* name = id == CommandId::Deps ? "deps" : "invalidate";
    if (cfg.db_path.empty()) {
        std::fprintf(stderr, "error: %s: --db is required\n", name);
        return EXIT_FAILURE;
    }
    if (cfg.command_text.empty()) {
        std::fprintf(stderr, "error: %s: missing command text\n", name);
        return EXIT_FAILURE;
    }

    tagcache::db::SqliteSchemaEnumerator enumerator;
    enumerator.register_database(cfg.owner, cfg.db_path);
    tagcache::catalog::ResourceCatalog catalog(enumerator);
    tagcache::deps::InvalidationCoordinator coordinator(catalog, cfg.settings);

    tagcache::core::TagSet tags;
    const tagcache::core::Status s = id == CommandId::Deps
        ? coordinator.resolve_read_dependencies(cfg.policy, cfg.owner, cfg.command_text, &tags)
        : coordinator.invalidation_tags(cfg.command_text, cfg.owner, cfg.policy, &tags);
    if (!tagcache::core::is_ok(s)) {
        print_status_error(name, s);
        return EXIT_FAILURE;
    }

    if (id == CommandId::Invalidate && tags.empty()) {
        std::printf("not mutating\n");
        return EXIT_SUCCESS;
    }
    print_tags(tags);
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        handle_help();
        return EXIT_FAILURE;
    }

    const tagcache::cli::CliArgs args{argv + 1, static_cast<tagcache::core::u32>(argc - 1)};
    tagcache::cli::CommandInvocation cmd;
    tagcache::core::u32 consumed = 0;
    tagcache::core::Status s = tagcache::cli::parse_command(
        args, g_commands.data(), static_cast<tagcache::core::u32>(g_commands.size()), &cmd, &consumed);
    if (!tagcache::core::is_ok(s)) {
        std::fprintf(stderr, "error: unknown command '%s'\n", argv[1]);
        return EXIT_FAILURE;
    }

    CliConfig cfg{};
    cfg.settings = tagcache::core::settings_from_env();
    s = load_config(cmd.args, &cfg);
    if (!tagcache::core::is_ok(s)) {
        print_status_error("option parsing", s);
        return EXIT_FAILURE;
    }
    tagcache::core::init_logging(cfg.settings.log_level);

    switch (cmd.id) {
        case CommandId::Help:
            handle_help();
            return EXIT_SUCCESS;
        case CommandId::Classify:
            return handle_classify(cfg);
        case CommandId::Tables:
            return handle_tables(cfg);
        case CommandId::Deps:
        case CommandId::Invalidate:
            return handle_resolve(cfg, cmd.id);
        case CommandId::None:
            break;
    }
    handle_help();
    return EXIT_FAILURE;
}
