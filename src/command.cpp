#include "argtree/command.hpp"

#include <algorithm>
#include <set>

#include "argtree/help.hpp"
#include "argtree/parser.hpp"

namespace argtree {

const Arg* Command::findArg(const std::string& name) const {
    for (const auto& a : args_) {
        if (a.name() == name) return &a;
    }
    return nullptr;
}

const Arg* Command::findLong(const std::string& key) const {
    for (const auto& a : args_) {
        if (a.matchesLong(key)) return &a;
    }
    return findArg(key);
}

const Arg* Command::findShort(char c) const {
    for (const auto& a : args_) {
        if (a.matchesShort(c)) return &a;
    }
    return nullptr;
}

const Command* Command::findSubcommand(const std::string& token) const {
    for (const auto& c : subcommands_) {
        if (c.matchesName(token)) return &c;
    }
    return nullptr;
}

bool Command::matchesName(const std::string& token) const {
    if (name_ == token) return true;
    return std::find(aliases_.begin(), aliases_.end(), token) != aliases_.end();
}

std::vector<const Arg*> Command::positionals() const {
    std::vector<const Arg*> out;
    for (const auto& a : args_) {
        if (a.isPositional()) out.push_back(&a);
    }
    std::stable_sort(out.begin(), out.end(), [](const Arg* x, const Arg* y) { return *x->index() < *y->index(); });
    return out;
}

std::optional<std::string> Command::validate(bool recursive) const {
    const std::string where = " in command '" + name_ + "'";

    std::set<std::string> names;
    std::set<char> shorts;
    std::set<std::string> longs;
    std::size_t lastCount = 0;
    for (const auto& a : args_) {
        if (a.name().empty()) return "argument with empty name" + where;
        if (!names.insert(a.name()).second) return "duplicate argument name '" + a.name() + "'" + where;
        if (const auto s = a.shortName()) {
            if (!shorts.insert(*s).second) return "duplicate short flag '-" + std::string(1, *s) + "'" + where;
        }
        if (const auto& l = a.longName()) {
            if (!longs.insert(*l).second) return "duplicate long flag '--" + *l + "'" + where;
        }
        if (a.last()) ++lastCount;
    }
    if (lastCount > 1) return "more than one variadic positional argument" + where;

    std::size_t expected = 0;
    for (const auto* p : positionals()) {
        if (p->last()) continue;
        if (*p->index() != expected) {
            return "positional argument '" + p->name() + "' has index " + std::to_string(*p->index()) + ", expected " +
                   std::to_string(expected) + where;
        }
        ++expected;
    }

    std::set<std::string> childNames;
    for (const auto& c : subcommands_) {
        if (!childNames.insert(c.name()).second) return "duplicate subcommand name or alias '" + c.name() + "'" + where;
        for (const auto& al : c.aliases()) {
            if (!childNames.insert(al).second) return "duplicate subcommand name or alias '" + al + "'" + where;
        }
    }

    if (!recursive) return std::nullopt;
    for (const auto& c : subcommands_) {
        if (auto err = c.validate(true)) return err;
    }
    return std::nullopt;
}

ParseResult Command::tryGetMatchesFrom(const std::vector<std::string>& argv) const {
    return parse(*this, argv);
}

std::string Command::generateHelp() const {
    return argtree::generateHelp(*this);
}

} // namespace argtree
