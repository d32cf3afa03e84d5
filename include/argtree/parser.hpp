#ifndef ARGTREE_PARSER_HPP
#define ARGTREE_PARSER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "argtree/command.hpp"

namespace argtree {

// Returns the value of an environment variable, or nullopt when it is unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& var)>;

struct ParseOptions {
    // Consulted during backfill for arguments declared with env(). Empty means std::getenv.
    EnvLookup envLookup{};
};

// Walks the argument vector against a command tree. One Parser may be reused for any number of parses;
// it holds no per-parse state.
class Parser {
public:
    explicit Parser(const Command& root) : Parser(root, ParseOptions{}) {}
    Parser(const Command& root, ParseOptions options);

    // argv[0] is the program name. Throws ConfigurationError when a visited command is malformed.
    ParseResult parse(const std::vector<std::string>& argv) const;

private:
    // Scans argv[begin..] against `cmd`, recursing into a recognized subcommand.
    ParseResult parseLevel(const Command& cmd, const std::vector<std::string>& argv, std::size_t begin) const;

    std::optional<CommandError> parseLong(const Command& cmd,
                                          const std::string& token,
                                          const std::vector<std::string>& argv,
                                          std::size_t& i,
                                          Matches& matches) const;
    std::optional<CommandError> parseShortGroup(const Command& cmd,
                                                const std::string& token,
                                                const std::vector<std::string>& argv,
                                                std::size_t& i,
                                                Matches& matches) const;

    // A value-taking argument that found no value token: store its default, if it has one.
    static void applyMissingValue(const Arg& arg, Matches& matches);

    // Splits, checks and stores one raw value. Nothing is stored on failure.
    std::optional<CommandError> processValue(const Arg& arg, const std::string& raw, Matches& matches) const;

    std::optional<CommandError> assignPositionals(const Command& cmd,
                                                  const std::vector<std::string>& candidates,
                                                  Matches& matches) const;

    // Post-scan checks for one level, in order: required, backfill, requires, conflicts, groups, dispatch.
    std::optional<CommandError> validate(const Command& cmd,
                                         const std::vector<std::string>& candidates,
                                         Matches& matches) const;
    std::optional<CommandError> checkRequired(const Command& cmd, const Matches& matches) const;
    void backfill(const Command& cmd, Matches& matches) const;
    std::optional<CommandError> checkRequirements(const Command& cmd, const Matches& matches) const;
    std::optional<CommandError> checkConflicts(const Command& cmd, const Matches& matches) const;
    std::optional<CommandError> checkGroups(const Command& cmd, const Matches& matches) const;
    std::optional<CommandError> checkDispatch(const Command& cmd,
                                              const std::vector<std::string>& candidates,
                                              const Matches& matches) const;

    std::optional<std::string> lookupEnv(const std::string& var) const;

    static bool startsWithDash(const std::string& s) { return !s.empty() && s.front() == '-'; }

    const Command& root_;
    ParseOptions options_;
};

// Parses `argv` (program name first) against `root`.
ParseResult parse(const Command& root, const std::vector<std::string>& argv, const ParseOptions& options = {});

} // namespace argtree

#endif // ARGTREE_PARSER_HPP
