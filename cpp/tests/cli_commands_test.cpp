#include <array>

#include <gtest/gtest.h>

#include "tagcache/cli/commands.hpp"

namespace {

const std::array<tagcache::cli::CommandSpec, 3> kSpecs = {{
    {tagcache::cli::CommandId::Help, "help", "h"},
    {tagcache::cli::CommandId::Classify, "classify", "c"},
    {tagcache::cli::CommandId::Deps, "deps", "d"},
}};

} // namespace

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const char* argv[] = {"deps", "--db", "app.db", "SELECT"};
    const tagcache::cli::CliArgs args{argv, 4};

    tagcache::cli::CommandInvocation out{};
    tagcache::cli::u32 consumed = 0;
    const tagcache::core::Status s = tagcache::cli::parse_command(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, tagcache::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, tagcache::cli::CommandId::Deps);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "--db");
}

TEST(CliCommands, MatchesAlias) {
    const char* argv[] = {"c", "SELECT 1"};
    tagcache::cli::CommandInvocation out{};
    tagcache::cli::u32 consumed = 0;
    ASSERT_TRUE(tagcache::core::is_ok(tagcache::cli::parse_command({argv, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed)));
    EXPECT_EQ(out.id, tagcache::cli::CommandId::Classify);
}

TEST(CliCommands, InvalidOnUnknownCommand) {
    const char* argv[] = {"nope"};
    tagcache::cli::CommandInvocation out{};
    tagcache::cli::u32 consumed = 0;
    const tagcache::core::Status s = tagcache::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, tagcache::core::StatusCode::Invalid);
    EXPECT_EQ(s.domain, tagcache::core::StatusDomain::Cli);
    EXPECT_EQ(out.id, tagcache::cli::CommandId::None);
}

TEST(CliCommands, InvalidOnOptionOrEmpty) {
    const char* argv[] = {"--db"};
    tagcache::cli::CommandInvocation out{};
    tagcache::cli::u32 consumed = 0;
    EXPECT_EQ(tagcache::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              tagcache::core::StatusCode::Invalid);
    EXPECT_EQ(tagcache::cli::parse_command({argv, 0}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              tagcache::core::StatusCode::Invalid);
}
