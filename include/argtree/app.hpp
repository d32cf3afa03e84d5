#ifndef ARGTREE_APP_HPP
#define ARGTREE_APP_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "argtree/command.hpp"
#include "argtree/parser.hpp"

namespace argtree {

// Process-facing wrapper around a root Command: prints help, version and errors, and exits.
// This is the only part of the library that writes to streams or terminates the process.
class App {
public:
    explicit App(Command root) : root_(std::move(root)) {}

    App& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    App& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    App& envLookup(EnvLookup lookup) {
        options_.envLookup = std::move(lookup);
        return *this;
    }

    // Append "Did you mean this?" hints to unknown argument/subcommand errors.
    App& suggestions(bool v = true) {
        suggestions_ = v;
        return *this;
    }

    App& suggestionsMinimumDistance(std::size_t d) {
        suggestionsMinimumDistance_ = d;
        return *this;
    }

    [[nodiscard]] const Command& command() const { return root_; }

    // Parses without printing or exiting.
    ParseResult tryGetMatchesFrom(const std::vector<std::string>& argv) const;

    // Writes the outcome of `error` and returns the exit code: 0 for help/version, 1 otherwise.
    int report(const CommandError& error) const;

    // On anything but success, reports and calls std::exit with the code from report().
    Matches getMatchesFrom(const std::vector<std::string>& argv) const;
    Matches getMatches(int argc, char** argv) const;

private:
    // The command at `path` (root first), or the deepest existing prefix of it.
    const Command& resolve(const std::vector<std::string>& path) const;
    std::vector<std::string> suggestFor(const CommandError& error, const Command& at) const;

    std::ostream& out() const;
    std::ostream& err() const;

    Command root_;
    ParseOptions options_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
    bool suggestions_{true};
    std::size_t suggestionsMinimumDistance_{2};
};

} // namespace argtree

#endif // ARGTREE_APP_HPP
