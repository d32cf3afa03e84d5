#include "argtree/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <set>
#include <utility>

#include "argtree/help.hpp"

namespace argtree {

namespace {

constexpr std::size_t kMaxSuggestions = 3;

// Levenshtein distance over one rolling row.
std::size_t editDistance(const std::string& from, const std::string& to) {
    std::vector<std::size_t> row(to.size() + 1);
    std::iota(row.begin(), row.end(), std::size_t{0});
    for (std::size_t i = 1; i <= from.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= to.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t substitute = diagonal + (from[i - 1] == to[j - 1] ? 0 : 1);
            row[j] = std::min({above + 1, row[j - 1] + 1, substitute});
            diagonal = above;
        }
    }
    return row[to.size()];
}

// Names that extend the typed text rank first, the rest by edit distance, ties alphabetically.
std::vector<std::string> closestNames(const std::string& typed, const std::set<std::string>& names, std::size_t maxDistance) {
    std::set<std::pair<std::size_t, std::string>> ranked;
    for (const auto& name : names) {
        if (name.empty() || name == typed) continue;
        const bool extendsTyped = !typed.empty() && name.rfind(typed, 0) == 0;
        const std::size_t score = extendsTyped ? 0 : editDistance(typed, name);
        if (score <= maxDistance) ranked.emplace(score, name);
    }

    std::vector<std::string> out;
    for (const auto& entry : ranked) {
        if (out.size() == kMaxSuggestions) break;
        out.push_back(entry.second);
    }
    return out;
}

} // namespace

ParseResult App::tryGetMatchesFrom(const std::vector<std::string>& argv) const {
    return parse(root_, argv, options_);
}

int App::report(const CommandError& error) const {
    const Command& at = resolve(error.commandPath());

    switch (error.kind()) {
        case CommandError::Kind::HelpRequested:
            out() << generateHelp(at);
            return 0;
        case CommandError::Kind::VersionRequested:
            out() << at.name() << " " << at.version().value_or("") << "\n";
            return 0;
        default:
            break;
    }

    err() << "Error: " << error.message() << "\n";
    if (suggestions_) {
        const auto sugg = suggestFor(error, at);
        if (!sugg.empty()) {
            err() << "\nDid you mean this?\n";
            for (const auto& s : sugg) err() << "    " << s << "\n";
        }
    }
    err() << "\nFor more information try --help\n";
    return 1;
}

Matches App::getMatchesFrom(const std::vector<std::string>& argv) const {
    auto result = tryGetMatchesFrom(argv);
    if (auto* error = std::get_if<CommandError>(&result)) std::exit(report(*error));
    return std::move(std::get<Matches>(result));
}

Matches App::getMatches(int argc, char** argv) const {
    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
    return getMatchesFrom(args);
}

const Command& App::resolve(const std::vector<std::string>& path) const {
    const Command* cur = &root_;
    for (std::size_t i = 1; i < path.size(); ++i) {
        const Command* next = cur->findSubcommand(path[i]);
        if (!next) break;
        cur = next;
    }
    return *cur;
}

std::vector<std::string> App::suggestFor(const CommandError& error, const Command& at) const {
    if (error.kind() == CommandError::Kind::UnknownSubcommand) {
        std::set<std::string> names;
        for (const auto& sub : at.subcommands()) {
            names.insert(sub.name());
            names.insert(sub.aliases().begin(), sub.aliases().end());
        }
        return closestNames(error.arg(), names, suggestionsMinimumDistance_);
    }

    // Single-character typos are too ambiguous to rank.
    if (error.kind() == CommandError::Kind::UnknownArgument && error.arg().size() > 1) {
        std::set<std::string> names;
        for (const auto& a : at.args()) {
            if (!a.isPositional()) names.insert(a.longName().value_or(a.name()));
        }
        auto sugg = closestNames(error.arg(), names, suggestionsMinimumDistance_);
        for (auto& s : sugg) s = "--" + s;
        return sugg;
    }
    return {};
}

std::ostream& App::out() const {
    if (out_) return *out_;
    return std::cout;
}

std::ostream& App::err() const {
    if (err_) return *err_;
    return std::cerr;
}

} // namespace argtree
