#include <gtest/gtest.h>

#include "argtree/parser.hpp"
#include "test_support.hpp"

using argtree::Arg;
using argtree::ArgGroup;
using argtree::Command;
using argtree::CommandError;
using argtree::Matches;
using argtree::ParseOptions;
using argtree::ParseResult;
using argtree::testing::argv;
using argtree::testing::describe;
using argtree::testing::fakeEnv;
using argtree::testing::noEnv;

namespace {

ParseResult run(const Command& cmd, std::initializer_list<const char*> tokens, const ParseOptions& options = noEnv()) {
    return argtree::parse(cmd, argv(tokens), options);
}

ParseOptions withEnv(std::map<std::string, std::string> vars) {
    ParseOptions options;
    options.envLookup = fakeEnv(std::move(vars));
    return options;
}

const CommandError& errorOf(const ParseResult& r) {
    return std::get<CommandError>(r);
}

} // namespace

TEST(Required, MissingRequiredOption) {
    const auto cmd = Command("t").arg(Arg("input").shortName('i').required(true));
    auto r = run(cmd, {});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingArgument);
    EXPECT_EQ(errorOf(r).message(), "the argument 'input' is required");
}

TEST(Required, RequiredPositional) {
    const auto cmd = Command("t").arg(Arg("file").index(0).required(true));
    auto missing = run(cmd, {});
    ASSERT_TRUE(std::holds_alternative<CommandError>(missing));
    EXPECT_EQ(errorOf(missing).arg(), "file");

    auto present = run(cmd, {"x"});
    EXPECT_TRUE(std::holds_alternative<Matches>(present)) << describe(present);
}

TEST(Required, CheckedBeforeEnvAndDefaultBackfill) {
    const auto cmd = Command("t").arg(Arg("token").longName("token").required(true).env("TOKEN").defaultValue("x"));
    auto r = run(cmd, {}, withEnv({{"TOKEN", "secret"}}));
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingArgument);
}

TEST(Required, OptionGivenWithoutValueButWithDefaultCountsAsPresent) {
    const auto cmd = Command("t").arg(Arg("level").longName("level").required(true).defaultValue("1"));
    auto r = run(cmd, {"--level"});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    EXPECT_EQ(std::get<Matches>(r).valueOf("level"), std::optional<std::string>("1"));
}

TEST(Backfill, EnvironmentBeatsDefault) {
    const auto cmd = Command("t").arg(Arg("config").longName("config").env("APP_CONFIG").defaultValue("config.toml"));
    auto fromEnv = run(cmd, {}, withEnv({{"APP_CONFIG", "env.toml"}}));
    ASSERT_TRUE(std::holds_alternative<Matches>(fromEnv)) << describe(fromEnv);
    EXPECT_EQ(std::get<Matches>(fromEnv).valueOf("config"), std::optional<std::string>("env.toml"));

    auto fromDefault = run(cmd, {});
    ASSERT_TRUE(std::holds_alternative<Matches>(fromDefault)) << describe(fromDefault);
    EXPECT_EQ(std::get<Matches>(fromDefault).valueOf("config"), std::optional<std::string>("config.toml"));
}

TEST(Backfill, CommandLineBeatsEnvironment) {
    const auto cmd = Command("t").arg(Arg("config").longName("config").env("APP_CONFIG"));
    auto r = run(cmd, {"--config", "cli.toml"}, withEnv({{"APP_CONFIG", "env.toml"}}));
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    EXPECT_EQ(std::get<Matches>(r).valueOf("config"), std::optional<std::string>("cli.toml"));
}

TEST(Backfill, ValuesAreStoredSingleAndUnvalidated) {
    const auto cmd = Command("t")
                         .arg(Arg("mode").longName("mode").possibleValues({"a", "b"}).defaultValue("zzz"))
                         .arg(Arg("tags").longName("tags").valueDelimiter(',').env("TAGS"));
    auto r = run(cmd, {}, withEnv({{"TAGS", "x,y"}}));
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    const auto& m = std::get<Matches>(r);
    EXPECT_EQ(m.valueOf("mode"), std::optional<std::string>("zzz"));
    EXPECT_EQ(m.valueOf("tags"), std::optional<std::string>("x,y"));
    EXPECT_FALSE(m.valuesOf("tags").has_value());
}

TEST(Backfill, UnsetEnvironmentFallsThrough) {
    const auto cmd = Command("t").arg(Arg("home").env("ARGTREE_SURELY_UNSET_VAR"));
    auto r = run(cmd, {}, ParseOptions{});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    EXPECT_FALSE(std::get<Matches>(r).isPresent("home"));
}

TEST(Requires, MissingDependency) {
    const auto cmd = Command("t")
                         .arg(Arg("output").longName("output").requiresArg("format"))
                         .arg(Arg("format").longName("format"));
    auto r = run(cmd, {"--output", "out.txt"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingDependency);
    EXPECT_EQ(errorOf(r).message(), "the argument 'output' requires 'format'");
}

TEST(Requires, SatisfiedByDefault) {
    const auto cmd = Command("t")
                         .arg(Arg("output").longName("output").requiresArg("format"))
                         .arg(Arg("format").longName("format").defaultValue("json"));
    auto r = run(cmd, {"--output", "out.txt"});
    EXPECT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
}

TEST(Requires, IgnoredWhenArgumentAbsent) {
    const auto cmd = Command("t").arg(Arg("output").longName("output").requiresArg("format")).arg(Arg("format"));
    auto r = run(cmd, {});
    EXPECT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
}

TEST(Conflicts, BothPresent) {
    const auto cmd = Command("t")
                         .arg(Arg("json").longName("json").takesValue(false).conflictsWith("yaml"))
                         .arg(Arg("yaml").longName("yaml").takesValue(false));
    auto r = run(cmd, {"--yaml", "--json"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::ArgumentConflict);
    EXPECT_EQ(errorOf(r).message(), "the argument 'json' cannot be used with 'yaml'");
}

TEST(Conflicts, DefaultsParticipate) {
    const auto cmd = Command("t")
                         .arg(Arg("fast").longName("fast").takesValue(false).conflictsWith("level"))
                         .arg(Arg("level").longName("level").defaultValue("3"));
    auto r = run(cmd, {"--fast"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::ArgumentConflict);
}

TEST(Groups, RequiredGroupWithNoMember) {
    const auto cmd = Command("t")
                         .arg(Arg("json").longName("json").takesValue(false))
                         .arg(Arg("yaml").longName("yaml").takesValue(false))
                         .group(ArgGroup("format").args({"json", "yaml"}).required(true));
    auto r = run(cmd, {});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingArgument);
    EXPECT_EQ(errorOf(r).arg(), "format (one of: json, yaml)");
}

TEST(Groups, MoreThanOneMemberConflictsInGroupOrder) {
    const auto cmd = Command("t")
                         .arg(Arg("a").longName("a").takesValue(false))
                         .arg(Arg("b").longName("b").takesValue(false))
                         .arg(Arg("c").longName("c").takesValue(false))
                         .group(ArgGroup("g").args({"c", "b", "a"}));
    auto r = run(cmd, {"--a", "--c", "--b"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::ArgumentConflict);
    EXPECT_EQ(errorOf(r).arg(), "c");
    EXPECT_EQ(errorOf(r).detail(), "b");
}

TEST(Groups, OptionalGroupAllowsNone) {
    const auto cmd = Command("t").arg(Arg("a").takesValue(false)).group(ArgGroup("g").arg("a"));
    EXPECT_TRUE(std::holds_alternative<Matches>(run(cmd, {})));
}

TEST(Pipeline, RequiredReportedBeforeConflicts) {
    const auto cmd = Command("t")
                         .arg(Arg("x").longName("x").takesValue(false).conflictsWith("y"))
                         .arg(Arg("y").longName("y").takesValue(false))
                         .arg(Arg("z").longName("z").required(true));
    auto r = run(cmd, {"--x", "--y"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingArgument);
}

TEST(Pipeline, DependenciesReportedBeforeConflicts) {
    const auto cmd = Command("t")
                         .arg(Arg("x").longName("x").takesValue(false).conflictsWith("y").requiresArg("w"))
                         .arg(Arg("y").longName("y").takesValue(false))
                         .arg(Arg("w").longName("w"));
    auto r = run(cmd, {"--x", "--y"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingDependency);
}

TEST(Pipeline, ChildErrorsWinOverParentChecks) {
    const auto cmd = Command("app")
                         .arg(Arg("token").longName("token").required(true))
                         .subcommand(Command("run").arg(Arg("what").index(0).required(true)));
    auto r = run(cmd, {"run"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).arg(), "what");

    auto parentFails = run(cmd, {"run", "job"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(parentFails));
    EXPECT_EQ(errorOf(parentFails).arg(), "token");
    EXPECT_EQ(errorOf(parentFails).commandPath(), std::vector<std::string>{"app"});
}

TEST(Dispatch, RequiredSubcommandMissing) {
    const auto cmd = Command("app").subcommandRequired(true).subcommand(Command("run"));
    auto r = run(cmd, {});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::MissingArgument);
    EXPECT_EQ(errorOf(r).arg(), "<COMMAND>");
}

TEST(Dispatch, UnrecognizedTokenIsUnknownSubcommand) {
    const auto cmd = Command("app").subcommandRequired(true).subcommand(Command("run"));
    auto r = run(cmd, {"rnu"});
    ASSERT_TRUE(std::holds_alternative<CommandError>(r));
    EXPECT_EQ(errorOf(r).kind(), CommandError::Kind::UnknownSubcommand);
    EXPECT_EQ(errorOf(r).message(), "unknown subcommand 'rnu'");
}

TEST(Dispatch, OptionalSubcommandTreatsTokenAsPositional) {
    const auto cmd = Command("app").subcommand(Command("run"));
    auto r = run(cmd, {"rnu"});
    ASSERT_TRUE(std::holds_alternative<Matches>(r)) << describe(r);
    EXPECT_EQ(std::get<Matches>(r).subcommand(), nullptr);
}
