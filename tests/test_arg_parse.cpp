#include <gtest/gtest.h>
#include <cli/arg_parse.hpp>
#include <cli/relay_cli.hpp>

TEST(Tokenize, QuotesAndEscapes) {
    auto t = tokenize_args("a 'b c' \"d \\\"e\\\"\" f\\ g");
    ASSERT_EQ(t.size(), 4u);
    EXPECT_EQ(t[0], "a");
    EXPECT_EQ(t[1], "b c");
    EXPECT_EQ(t[2], "d \"e\"");
    EXPECT_EQ(t[3], "f g");
}

TEST(Tokenize, EmptyQuotedToken) {
    auto t = tokenize_args("x '' y");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[1], "");
}

TEST(CommandSeparator, OnlyStandaloneUnquoted) {
    EXPECT_EQ(find_command_separator("101 -- ls"), 4u);
    EXPECT_EQ(find_command_separator("101 '--' ls"), std::string::npos);
    EXPECT_EQ(find_command_separator("101 --timeout 5"), std::string::npos);
    EXPECT_EQ(find_command_separator("--"), 0u);
}

TEST(ParseArgs, OptionsFlagsAndCommand) {
    auto a = parse_args("101 --timeout 60 --format yaml -- ls -la | grep 'x y' -- z",
                        {"timeout", "format"});
    ASSERT_EQ(a.positional.size(), 1u);
    EXPECT_EQ(a.positional[0], "101");
    EXPECT_EQ(a.option("timeout"), "60");
    EXPECT_EQ(a.option("format"), "yaml");
    EXPECT_TRUE(a.has_command);
    // The command keeps its own quoting and any later "--"
    EXPECT_EQ(a.command, "ls -la | grep 'x y' -- z");
}

TEST(ParseArgs, FlagsAndMissingValue) {
    auto a = parse_args("101 /a /b --overwrite --perms", {"perms"});
    EXPECT_TRUE(a.flag("overwrite"));
    EXPECT_EQ(a.positional.size(), 3u);
    ASSERT_EQ(a.errors.size(), 1u);
    EXPECT_EQ(a.option("perms", "644"), "644");
}

TEST(ParseVmid, Range) {
    EXPECT_EQ(parse_vmid("100"), 100);
    EXPECT_EQ(parse_vmid("999999999"), 999999999);
    EXPECT_FALSE(parse_vmid("99").has_value());
    EXPECT_FALSE(parse_vmid("1000000000").has_value());
    EXPECT_FALSE(parse_vmid("10a").has_value());
    EXPECT_FALSE(parse_vmid("-101").has_value());
}

TEST(ParseTimeout, Range) {
    EXPECT_EQ(parse_timeout("1"), 1);
    EXPECT_EQ(parse_timeout("300"), 300);
    EXPECT_FALSE(parse_timeout("0").has_value());
    EXPECT_FALSE(parse_timeout("301").has_value());
}

TEST(JoinArgv, WordsSurviveReparsing) {
    std::vector<std::string> argv = {"101", "/root/my file", "/tmp/it's", "--overwrite"};
    auto a = parse_args(RelayCLI::join_argv(argv), {});
    ASSERT_EQ(a.positional.size(), 3u);
    EXPECT_EQ(a.positional[1], "/root/my file");
    EXPECT_EQ(a.positional[2], "/tmp/it's");
    EXPECT_TRUE(a.flag("overwrite"));
}

TEST(JoinArgv, CommandAfterSeparatorIsRaw) {
    std::vector<std::string> argv = {"101", "--", "echo", "$HOME", "|", "wc"};
    auto a = parse_args(RelayCLI::join_argv(argv), {});
    EXPECT_TRUE(a.has_command);
    EXPECT_EQ(a.command, "echo $HOME | wc");
}
