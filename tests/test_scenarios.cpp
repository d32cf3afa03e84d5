#include <gtest/gtest.h>

#include <cstdlib>

#include "argtree/help.hpp"
#include "argtree/parser.hpp"
#include "test_support.hpp"

using argtree::Arg;
using argtree::Command;
using argtree::CommandError;
using argtree::Matches;
using argtree::ParseOptions;
using argtree::ParseResult;
using argtree::testing::describe;
using argtree::testing::noEnv;

namespace {

ParseResult run(const Command& cmd, std::vector<std::string> args, const ParseOptions& options = noEnv()) {
    return argtree::parse(cmd, args, options);
}

} // namespace

TEST(Scenario, GitCommitMessage) {
    const auto git = Command("git").subcommand(
        Command("commit").arg(Arg("message").shortName('m').longName("message").required(true)));
    auto r = run(git, {"git", "commit", "-m", "Initial commit"});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    const auto& m = std::get<Matches>(r);
    EXPECT_EQ(m.subcommandName(), std::optional<std::string>("commit"));
    const auto* commit = m.subcommandMatches("commit");
    ASSERT_NE(commit, nullptr);
    EXPECT_EQ(commit->valueOf("message"), std::optional<std::string>("Initial commit"));
}

TEST(Scenario, CombinedShortFlags) {
    const auto cmd = Command("test")
                         .arg(Arg("verbose").shortName('v').takesValue(false))
                         .arg(Arg("debug").shortName('d').takesValue(false))
                         .arg(Arg("quiet").shortName('q').takesValue(false));
    auto r = run(cmd, {"test", "-vdq"});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    const auto& m = std::get<Matches>(r);
    EXPECT_TRUE(m.isPresent("verbose"));
    EXPECT_TRUE(m.isPresent("debug"));
    EXPECT_TRUE(m.isPresent("quiet"));
}

TEST(Scenario, DelimitedTagsAreTrimmed) {
    const auto cmd = Command("test").arg(Arg("tags").longName("tags").valueDelimiter(','));
    auto r = run(cmd, {"test", "--tags", "rust, cli , tool"});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    EXPECT_EQ(std::get<Matches>(r).valuesOf("tags"), (std::vector<std::string>{"rust", "cli", "tool"}));
}

TEST(Scenario, MissingFormatDependency) {
    const auto cmd = Command("test")
                         .arg(Arg("output").longName("output").requiresArg("format"))
                         .arg(Arg("format").longName("format"));
    auto r = run(cmd, {"test", "--output", "out.txt"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    const auto& err = std::get<CommandError>(r);
    EXPECT_EQ(err.kind(), CommandError::Kind::MissingDependency);
    EXPECT_EQ(err.arg(), "output");
    EXPECT_EQ(err.detail(), "format");
}

TEST(Scenario, VariadicFilesAfterFlag) {
    const auto cmd = Command("test")
                         .arg(Arg("verbose").shortName('v').takesValue(false))
                         .arg(Arg("files").last(true));
    auto r = run(cmd, {"test", "-v", "a.txt", "b.txt", "c.txt"});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    const auto& m = std::get<Matches>(r);
    EXPECT_EQ(m.valuesOf("files"), (std::vector<std::string>{"a.txt", "b.txt", "c.txt"}));
    EXPECT_TRUE(m.isPresent("verbose"));
}

TEST(Scenario, EnvironmentBeatsDefault) {
    ASSERT_EQ(::setenv("APP_CONFIG", "from_env.toml", 1), 0);
    const auto cmd = Command("test").arg(Arg("config").longName("config").env("APP_CONFIG").defaultValue("config.toml"));
    auto r = run(cmd, {"test"}, ParseOptions{});
    ::unsetenv("APP_CONFIG");
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    EXPECT_EQ(std::get<Matches>(r).valueOf("config"), std::optional<std::string>("from_env.toml"));
}

namespace {

Command propertyCommand() {
    return Command("prop")
        .arg(Arg("name").shortName('n').longName("name"))
        .arg(Arg("count").longName("count").defaultValue("3"))
        .arg(Arg("include").longName("include").multiple(true))
        .arg(Arg("tags").longName("tags").valueDelimiter(','))
        .arg(Arg("mode").longName("mode").possibleValues({"fast", "slow"}))
        .arg(Arg("verbose").shortName('v').takesValue(false))
        .arg(Arg("file").index(0));
}

// Compares every stored value; Matches itself is move-only and has no operator==.
void expectSameMatches(const ParseResult& a, const ParseResult& b) {
    ASSERT_TRUE(std::holds_alternative<Matches>(a)) << describe(a);
    ASSERT_TRUE(std::holds_alternative<Matches>(b)) << describe(b);
    const auto& ma = std::get<Matches>(a);
    const auto& mb = std::get<Matches>(b);
    EXPECT_EQ(ma.commandName(), mb.commandName());
    EXPECT_TRUE(ma.args() == mb.args());
}

} // namespace

TEST(Property, EqualsAndSpaceFormsAreEquivalent) {
    const auto cmd = propertyCommand();
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"name", "alice"}, {"count", "10"}, {"include", "src"}, {"tags", "a, b"}, {"mode", "slow"}};
    for (const auto& [flag, value] : cases) {
        SCOPED_TRACE(flag);
        auto joined = run(cmd, {"prop", "-v", "--" + flag + "=" + value, "input.txt"});
        auto spaced = run(cmd, {"prop", "-v", "--" + flag, value, "input.txt"});
        expectSameMatches(joined, spaced);
    }
}

TEST(Property, RenderedDefaultReparsesToSameValue) {
    const auto cmd = propertyCommand();
    auto implicit = run(cmd, {"prop"});
    ASSERT_TRUE(std::holds_alternative<Matches>(implicit)) << describe(implicit);
    const auto rendered = std::get<Matches>(implicit).valueOf("count");
    ASSERT_TRUE(rendered.has_value());

    auto explicitRun = run(cmd, {"prop", "--count", *rendered});
    ASSERT_TRUE(std::holds_alternative<Matches>(explicitRun)) << describe(explicitRun);
    EXPECT_EQ(*std::get<Matches>(explicitRun).find("count"), *std::get<Matches>(implicit).find("count"));
}

TEST(Property, OmittedRequiredArgumentAlwaysReported) {
    const auto cmd = Command("req")
                         .arg(Arg("x").shortName('x').longName("xx").required(true))
                         .arg(Arg("y").shortName('y').takesValue(false))
                         .arg(Arg("z").longName("z"))
                         .arg(Arg("p").index(0));
    const std::vector<std::vector<std::string>> inputs = {
        {"req"},
        {"req", "-y"},
        {"req", "--z", "1", "pos"},
        {"req", "pos", "-y", "--z=2"},
        {"req", "-yy", "extra", "more"},
    };
    for (const auto& in : inputs) {
        auto r = run(cmd, in);
        ASSERT_TRUE(std::holds_alternative<CommandError>(r));
        EXPECT_EQ(std::get<CommandError>(r).kind(), CommandError::Kind::MissingArgument);
        EXPECT_EQ(std::get<CommandError>(r).arg(), "x");
    }
}

TEST(Property, DeclaredConflictAlwaysReported) {
    const auto cmd = Command("c")
                         .arg(Arg("a").shortName('a').longName("aa").takesValue(false).conflictsWith("b"))
                         .arg(Arg("b").shortName('b').longName("bb"))
                         .arg(Arg("v").shortName('v').takesValue(false));
    const std::vector<std::vector<std::string>> inputs = {
        {"c", "-a", "-b", "1"},
        {"c", "--bb=1", "--aa"},
        {"c", "-va", "--bb", "x"},
        {"c", "-ab", "2"},
    };
    for (const auto& in : inputs) {
        auto r = run(cmd, in);
        ASSERT_TRUE(std::holds_alternative<CommandError>(r)) << describe(r);
        EXPECT_EQ(std::get<CommandError>(r).kind(), CommandError::Kind::ArgumentConflict);
    }
}

TEST(Property, HelpIsDeterministic) {
    const auto cmd = propertyCommand().about("Property fixture").subcommand(Command("sub").alias("s"));
    const auto first = argtree::generateHelp(cmd);
    for (int i = 0; i < 3; ++i) EXPECT_EQ(argtree::generateHelp(cmd), first);
}
