#ifndef ARGTREE_COMMAND_HPP
#define ARGTREE_COMMAND_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "argtree/arg.hpp"
#include "argtree/error.hpp"
#include "argtree/matches.hpp"

namespace argtree {

// Either the matches for the whole command path or the first error encountered.
using ParseResult = std::variant<Matches, CommandError>;

// A node of the command tree: its own arguments and groups plus nested subcommands, owned by value.
//
//     Command("git")
//         .about("A version control system")
//         .subcommand(Command("commit").arg(Arg("message").shortName('m').required(true)))
class Command {
public:
    explicit Command(std::string name) : name_(std::move(name)) {}

    Command& about(std::string text) {
        about_ = std::move(text);
        return *this;
    }

    // Longer description shown in help under the about line.
    Command& longAbout(std::string text) {
        longAbout_ = std::move(text);
        return *this;
    }

    // Enables --version / -V.
    Command& version(std::string v) {
        version_ = std::move(v);
        return *this;
    }

    Command& arg(Arg a) {
        args_.push_back(std::move(a));
        return *this;
    }

    Command& args(std::vector<Arg> list) {
        for (auto& a : list) args_.push_back(std::move(a));
        return *this;
    }

    Command& subcommand(Command child) {
        subcommands_.push_back(std::move(child));
        return *this;
    }

    Command& subcommands(std::vector<Command> children) {
        for (auto& c : children) subcommands_.push_back(std::move(c));
        return *this;
    }

    Command& group(ArgGroup g) {
        groups_.push_back(std::move(g));
        return *this;
    }

    Command& alias(std::string a) {
        aliases_.push_back(std::move(a));
        return *this;
    }

    Command& aliases(std::vector<std::string> list) {
        for (auto& a : list) aliases_.push_back(std::move(a));
        return *this;
    }

    // A level with this set fails unless one of its subcommands is matched.
    Command& subcommandRequired(bool v) {
        subcommandRequired_ = v;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::optional<std::string>& about() const { return about_; }
    [[nodiscard]] const std::optional<std::string>& longAbout() const { return longAbout_; }
    [[nodiscard]] const std::optional<std::string>& version() const { return version_; }
    [[nodiscard]] const std::vector<Arg>& args() const { return args_; }
    [[nodiscard]] const std::vector<Command>& subcommands() const { return subcommands_; }
    [[nodiscard]] const std::vector<ArgGroup>& groups() const { return groups_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] bool subcommandRequired() const { return subcommandRequired_; }

    // Lookup by argument name.
    const Arg* findArg(const std::string& name) const;

    // Resolves `--key`: the argument whose long flag is `key`, else the argument named `key`.
    const Arg* findLong(const std::string& key) const;

    const Arg* findShort(char c) const;

    // Child whose name or one of whose aliases equals `token`.
    const Command* findSubcommand(const std::string& token) const;

    bool matchesName(const std::string& token) const;

    // Positional arguments sorted by index (the variadic one, if any, last).
    std::vector<const Arg*> positionals() const;

    // First descriptor invariant violation, if any. Recurses into subcommands unless `recursive` is false.
    std::optional<std::string> validate(bool recursive = true) const;

    // argv[0] is the program name and is skipped.
    ParseResult tryGetMatchesFrom(const std::vector<std::string>& argv) const;

    std::string generateHelp() const;

private:
    std::string name_;
    std::optional<std::string> about_;
    std::optional<std::string> longAbout_;
    std::optional<std::string> version_;
    std::vector<Arg> args_;
    std::vector<Command> subcommands_;
    std::vector<ArgGroup> groups_;
    std::vector<std::string> aliases_;
    bool subcommandRequired_{false};
};

} // namespace argtree

#endif // ARGTREE_COMMAND_HPP
