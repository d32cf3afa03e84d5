#include "argtree/matches.hpp"

namespace argtree {

std::vector<std::string> ArgValue::rawValues() const {
    if (const auto* s = single()) return {*s};
    if (const auto* v = multiple()) return *v;
    return {*flag() ? "true" : "false"};
}

std::optional<std::string> Matches::valueOf(const std::string& name) const {
    const auto* v = find(name);
    if (!v || !v->isSingle()) return std::nullopt;
    return *v->single();
}

bool Matches::isFlagSet(const std::string& name) const {
    const auto* v = find(name);
    return v && v->isFlag() && *v->flag();
}

std::optional<std::vector<std::string>> Matches::valuesOf(const std::string& name) const {
    const auto* v = find(name);
    if (!v || !v->isMultiple()) return std::nullopt;
    return *v->multiple();
}

const ArgValue* Matches::find(const std::string& name) const {
    const auto it = args_.find(name);
    return it == args_.end() ? nullptr : &it->second;
}

ArgValue* Matches::findMutable(const std::string& name) {
    const auto it = args_.find(name);
    return it == args_.end() ? nullptr : &it->second;
}

std::optional<std::string> Matches::subcommandName() const {
    if (!subcommand_) return std::nullopt;
    return subcommand_->first;
}

const Matches* Matches::subcommandMatches(const std::string& name) const {
    if (!subcommand_) return nullptr;
    if (subcommand_->first == name || subcommand_->second.commandName() == name) return &subcommand_->second;
    return nullptr;
}

} // namespace argtree
