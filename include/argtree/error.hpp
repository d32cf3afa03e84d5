#ifndef ARGTREE_ERROR_HPP
#define ARGTREE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace argtree {

// Thrown by parse() when a Command descriptor violates its own invariants
// (duplicate names or flags, more than one variadic positional, gapped indices).
class ConfigurationError : public std::logic_error {
public:
    explicit ConfigurationError(const std::string& what) : std::logic_error(what) {}
};

// A classified parse failure. HelpRequested and VersionRequested are signals, not failures:
// they abort parsing the same way but the caller is expected to render help/version and exit 0.
class CommandError {
public:
    enum class Kind {
        MissingArgument,
        UnknownArgument,
        UnknownSubcommand,
        ValidationError,
        ArgumentConflict,
        MissingDependency,
        HelpRequested,
        VersionRequested,
    };

    static CommandError missingArgument(std::string name) { return CommandError(Kind::MissingArgument, std::move(name)); }
    static CommandError unknownArgument(std::string token) { return CommandError(Kind::UnknownArgument, std::move(token)); }
    static CommandError unknownSubcommand(std::string token) {
        return CommandError(Kind::UnknownSubcommand, std::move(token));
    }
    static CommandError validation(std::string name, std::string message) {
        return CommandError(Kind::ValidationError, std::move(name), std::move(message));
    }
    static CommandError conflict(std::string name, std::string other) {
        return CommandError(Kind::ArgumentConflict, std::move(name), std::move(other));
    }
    static CommandError missingDependency(std::string name, std::string required) {
        return CommandError(Kind::MissingDependency, std::move(name), std::move(required));
    }
    static CommandError helpRequested() { return CommandError(Kind::HelpRequested, {}); }
    static CommandError versionRequested() { return CommandError(Kind::VersionRequested, {}); }

    [[nodiscard]] Kind kind() const { return kind_; }

    // Offending argument name, group description or unrecognized token.
    [[nodiscard]] const std::string& arg() const { return arg_; }

    // Second argument for conflicts/dependencies, rejection message for validation errors.
    [[nodiscard]] const std::string& detail() const { return detail_; }

    // Names of the commands from the root down to the level that raised the error.
    [[nodiscard]] const std::vector<std::string>& commandPath() const { return commandPath_; }

    [[nodiscard]] bool isSignal() const { return kind_ == Kind::HelpRequested || kind_ == Kind::VersionRequested; }

    [[nodiscard]] std::string message() const;

    // Parser bookkeeping: each level prepends its own name while the error unwinds.
    CommandError& atCommand(const std::string& name) {
        commandPath_.insert(commandPath_.begin(), name);
        return *this;
    }

private:
    CommandError(Kind kind, std::string arg, std::string detail = {})
        : kind_(kind), arg_(std::move(arg)), detail_(std::move(detail)) {}

    Kind kind_;
    std::string arg_;
    std::string detail_;
    std::vector<std::string> commandPath_;
};

const char* toString(CommandError::Kind kind);

} // namespace argtree

#endif // ARGTREE_ERROR_HPP
