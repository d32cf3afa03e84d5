#include "argtree/parser.hpp"

#include <cstdlib>
#include <utility>

#include "argtree/utils.hpp"

namespace argtree {

namespace {

// Re-tags an error raised at `cmd` (or below) with the command path while it unwinds.
ParseResult failAt(const Command& cmd, CommandError err) {
    err.atCommand(cmd.name());
    return ParseResult(std::move(err));
}

// Byte length of the UTF-8 sequence introduced by `lead`; 1 for ASCII and stray bytes.
std::size_t utf8SequenceLength(unsigned char lead) {
    if (lead >= 0xF0 && lead <= 0xF7) return 4;
    if (lead >= 0xE0) return lead <= 0xEF ? 3 : 1;
    if (lead >= 0xC0) return 2;
    return 1;
}

} // namespace

Parser::Parser(const Command& root, ParseOptions options) : root_(root), options_(std::move(options)) {}

ParseResult Parser::parse(const std::vector<std::string>& argv) const {
    return parseLevel(root_, argv, argv.empty() ? 0 : 1);
}

ParseResult Parser::parseLevel(const Command& cmd, const std::vector<std::string>& argv, std::size_t begin) const {
    if (auto problem = cmd.validate(false)) throw ConfigurationError(*problem);

    Matches matches(cmd.name());
    std::vector<std::string> candidates;

    for (std::size_t i = begin; i < argv.size(); ++i) {
        const std::string& token = argv[i];

        if (token == "--help" || token == "-h") return failAt(cmd, CommandError::helpRequested());
        if (cmd.version() && (token == "--version" || token == "-V")) {
            return failAt(cmd, CommandError::versionRequested());
        }

        if (!startsWithDash(token)) {
            if (const Command* child = cmd.findSubcommand(token)) {
                auto nested = parseLevel(*child, argv, i + 1);
                if (auto* err = std::get_if<CommandError>(&nested)) return failAt(cmd, std::move(*err));
                matches.setSubcommand(token, std::move(std::get<Matches>(nested)));
                break;
            }
            candidates.push_back(token);
            continue;
        }

        std::optional<CommandError> err;
        if (token.rfind("--", 0) == 0) {
            err = parseLong(cmd, token, argv, i, matches);
        } else if (token.size() > 1) {
            err = parseShortGroup(cmd, token, argv, i, matches);
        }
        // A lone "-" matches nothing and is skipped.
        if (err) return failAt(cmd, std::move(*err));
    }

    if (auto err = assignPositionals(cmd, candidates, matches)) return failAt(cmd, std::move(*err));
    if (auto err = validate(cmd, candidates, matches)) return failAt(cmd, std::move(*err));
    return ParseResult(std::move(matches));
}

std::optional<CommandError> Parser::parseLong(const Command& cmd,
                                              const std::string& token,
                                              const std::vector<std::string>& argv,
                                              std::size_t& i,
                                              Matches& matches) const {
    const std::string body = token.substr(2);
    if (body.empty()) return CommandError::unknownArgument(token);

    // --key=value
    const auto eq = body.find('=');
    if (eq != std::string::npos) {
        const std::string key = body.substr(0, eq);
        if (key.empty()) return CommandError::unknownArgument(token);
        const Arg* arg = cmd.findLong(key);
        if (!arg) return CommandError::unknownArgument(key);
        return processValue(*arg, body.substr(eq + 1), matches);
    }

    const Arg* arg = cmd.findLong(body);
    if (!arg) return CommandError::unknownArgument(body);

    if (!arg->takesValue()) {
        matches.insert(arg->name(), ArgValue(true));
        return std::nullopt;
    }
    if (i + 1 < argv.size() && !startsWithDash(argv[i + 1])) {
        ++i;
        return processValue(*arg, argv[i], matches);
    }
    applyMissingValue(*arg, matches);
    return std::nullopt;
}

std::optional<CommandError> Parser::parseShortGroup(const Command& cmd,
                                                    const std::string& token,
                                                    const std::vector<std::string>& argv,
                                                    std::size_t& i,
                                                    Matches& matches) const {
    for (std::size_t pos = 1; pos < token.size(); ++pos) {
        const char c = token[pos];
        const auto lead = static_cast<unsigned char>(c);
        if (lead >= 0x80) {
            // Short names are single bytes, so a multibyte character is never one; name all of it.
            return CommandError::unknownArgument(token.substr(pos, utf8SequenceLength(lead)));
        }
        const Arg* arg = cmd.findShort(c);
        if (!arg) return CommandError::unknownArgument(std::string(1, c));

        if (!arg->takesValue()) {
            matches.insert(arg->name(), ArgValue(true));
            continue;
        }

        // Only the last character of the group may take the following token as its value.
        const bool lastInGroup = (pos + 1 == token.size());
        if (lastInGroup && i + 1 < argv.size() && !startsWithDash(argv[i + 1])) {
            ++i;
            if (auto err = processValue(*arg, argv[i], matches)) return err;
            continue;
        }
        applyMissingValue(*arg, matches);
    }
    return std::nullopt;
}

void Parser::applyMissingValue(const Arg& arg, Matches& matches) {
    if (const auto& def = arg.defaultValue()) matches.insert(arg.name(), ArgValue(*def));
}

std::optional<CommandError> Parser::processValue(const Arg& arg, const std::string& raw, Matches& matches) const {
    if (const auto delimiter = arg.valueDelimiter()) {
        std::vector<std::string> pieces;
        for (const auto& piece : utils::split(raw, *delimiter)) pieces.emplace_back(utils::trimWs(piece));
        for (const auto& piece : pieces) {
            if (auto msg = arg.check(piece)) return CommandError::validation(arg.name(), *msg);
        }
        matches.insert(arg.name(), ArgValue(std::move(pieces)));
        return std::nullopt;
    }

    if (auto msg = arg.check(raw)) return CommandError::validation(arg.name(), *msg);

    if (arg.multiple()) {
        if (auto* existing = matches.findMutable(arg.name())) {
            if (auto* seq = existing->multiple()) {
                seq->push_back(raw);
                return std::nullopt;
            }
        }
        matches.insert(arg.name(), ArgValue(std::vector<std::string>{raw}));
        return std::nullopt;
    }

    matches.insert(arg.name(), ArgValue(raw));
    return std::nullopt;
}

std::optional<CommandError> Parser::assignPositionals(const Command& cmd,
                                                      const std::vector<std::string>& candidates,
                                                      Matches& matches) const {
    const auto slots = cmd.positionals();
    for (std::size_t idx = 0; idx < slots.size(); ++idx) {
        const Arg& arg = *slots[idx];
        if (arg.last()) {
            if (idx >= candidates.size()) continue;
            std::vector<std::string> rest(candidates.begin() + static_cast<std::ptrdiff_t>(idx), candidates.end());
            for (const auto& v : rest) {
                if (auto msg = arg.check(v)) return CommandError::validation(arg.name(), *msg);
            }
            matches.insert(arg.name(), ArgValue(std::move(rest)));
            continue;
        }
        if (idx < candidates.size()) {
            if (auto err = processValue(arg, candidates[idx], matches)) return err;
        }
    }
    return std::nullopt;
}

std::optional<CommandError> Parser::validate(const Command& cmd,
                                             const std::vector<std::string>& candidates,
                                             Matches& matches) const {
    if (auto err = checkRequired(cmd, matches)) return err;
    backfill(cmd, matches);
    if (auto err = checkRequirements(cmd, matches)) return err;
    if (auto err = checkConflicts(cmd, matches)) return err;
    if (auto err = checkGroups(cmd, matches)) return err;
    return checkDispatch(cmd, candidates, matches);
}

std::optional<CommandError> Parser::checkRequired(const Command& cmd, const Matches& matches) const {
    for (const auto& a : cmd.args()) {
        if (a.required() && !matches.isPresent(a.name())) return CommandError::missingArgument(a.name());
    }
    return std::nullopt;
}

void Parser::backfill(const Command& cmd, Matches& matches) const {
    for (const auto& a : cmd.args()) {
        if (matches.isPresent(a.name())) continue;
        if (const auto& var = a.env()) {
            if (auto value = lookupEnv(*var)) {
                matches.insert(a.name(), ArgValue(std::move(*value)));
                continue;
            }
        }
        if (const auto& def = a.defaultValue()) matches.insert(a.name(), ArgValue(*def));
    }
}

std::optional<CommandError> Parser::checkRequirements(const Command& cmd, const Matches& matches) const {
    for (const auto& a : cmd.args()) {
        if (!matches.isPresent(a.name())) continue;
        for (const auto& needed : a.requirements()) {
            if (!matches.isPresent(needed)) return CommandError::missingDependency(a.name(), needed);
        }
    }
    return std::nullopt;
}

std::optional<CommandError> Parser::checkConflicts(const Command& cmd, const Matches& matches) const {
    for (const auto& a : cmd.args()) {
        if (!matches.isPresent(a.name())) continue;
        for (const auto& other : a.conflicts()) {
            if (matches.isPresent(other)) return CommandError::conflict(a.name(), other);
        }
    }
    return std::nullopt;
}

std::optional<CommandError> Parser::checkGroups(const Command& cmd, const Matches& matches) const {
    for (const auto& g : cmd.groups()) {
        std::vector<std::string> present;
        for (const auto& member : g.args()) {
            if (matches.isPresent(member)) present.push_back(member);
        }
        if (g.required() && present.empty()) {
            return CommandError::missingArgument(g.name() + " (one of: " + utils::join(g.args(), ", ") + ")");
        }
        if (present.size() > 1) return CommandError::conflict(present[0], present[1]);
    }
    return std::nullopt;
}

std::optional<CommandError> Parser::checkDispatch(const Command& cmd,
                                                  const std::vector<std::string>& candidates,
                                                  const Matches& matches) const {
    if (!cmd.subcommandRequired() || matches.subcommand()) return std::nullopt;
    if (!candidates.empty()) return CommandError::unknownSubcommand(candidates.front());
    return CommandError::missingArgument("<COMMAND>");
}

std::optional<std::string> Parser::lookupEnv(const std::string& var) const {
    if (options_.envLookup) return options_.envLookup(var);
    if (const char* v = std::getenv(var.c_str())) return std::string(v);
    return std::nullopt;
}

ParseResult parse(const Command& root, const std::vector<std::string>& argv, const ParseOptions& options) {
    return Parser(root, options).parse(argv);
}

} // namespace argtree
