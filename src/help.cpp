#include "argtree/help.hpp"

#include <sstream>
#include <vector>

#include "argtree/command.hpp"
#include "argtree/utils.hpp"

namespace argtree {

namespace {

std::string positionalToken(const Arg& arg) {
    const std::string upper = utils::toUpperAscii(arg.name());
    if (arg.last()) return "[" + upper + "]...";
    if (arg.required()) return "<" + upper + ">";
    return "[" + upper + "]";
}

// "    <entry><padding><description>\n"
void writeEntry(std::ostringstream& oss, const std::string& entry, const std::string& description) {
    std::string line = "    " + entry;
    if (!description.empty()) {
        if (line.size() < kHelpColumnWidth) {
            line.append(kHelpColumnWidth - line.size(), ' ');
        } else {
            line.push_back(' ');
        }
        line += description;
    }
    oss << line << "\n";
}

std::string describeArg(const Arg& arg, bool positional) {
    std::string desc = arg.help().value_or("");
    auto annotate = [&desc](const std::string& note) {
        if (!desc.empty()) desc.push_back(' ');
        desc += note;
    };
    if (arg.required()) annotate("[required]");
    if (positional) return desc;
    if (const auto& def = arg.defaultValue()) annotate("[default: " + *def + "]");
    if (const auto& var = arg.env()) annotate("[env: " + *var + "]");
    if (!arg.possibleValues().empty()) annotate("[possible values: " + utils::join(arg.possibleValues(), ", ") + "]");
    return desc;
}

} // namespace

std::string buildUsageLine(const Command& cmd) {
    std::string usage = cmd.name();
    bool hasOptions = false;
    for (const auto& a : cmd.args()) {
        if (!a.isPositional()) {
            hasOptions = true;
            break;
        }
    }
    if (hasOptions) usage += " [OPTIONS]";
    for (const auto* p : cmd.positionals()) usage += " " + positionalToken(*p);
    if (!cmd.subcommands().empty()) usage += " <COMMAND>";
    return usage;
}

std::string formatArgForHelp(const Arg& arg) {
    if (arg.isPositional()) return "<" + utils::toUpperAscii(arg.name()) + ">";

    std::string names;
    if (const auto s = arg.shortName()) {
        names += std::string("-") + *s;
        if (arg.longName()) names += ", ";
    }
    if (const auto& l = arg.longName()) names += "--" + *l;
    if (names.empty()) names = "--" + arg.name();
    if (arg.takesValue()) names += " <" + utils::toUpperAscii(arg.name()) + ">";
    return names;
}

std::string generateHelp(const Command& cmd) {
    std::ostringstream oss;

    if (const auto& about = cmd.about()) oss << *about << "\n";
    if (const auto& longAbout = cmd.longAbout()) oss << "\n" << *longAbout << "\n";
    if (const auto& version = cmd.version()) oss << "\nVersion: " << *version << "\n";

    oss << "\nUSAGE:\n    " << buildUsageLine(cmd) << "\n";

    const auto positionals = cmd.positionals();
    if (!positionals.empty()) {
        oss << "\nARGS:\n";
        for (const auto* p : positionals) writeEntry(oss, formatArgForHelp(*p), describeArg(*p, true));
    }

    std::vector<const Arg*> options;
    for (const auto& a : cmd.args()) {
        if (!a.isPositional()) options.push_back(&a);
    }
    if (!options.empty()) {
        oss << "\nOPTIONS:\n";
        for (const auto* o : options) writeEntry(oss, formatArgForHelp(*o), describeArg(*o, false));
    }

    if (!cmd.subcommands().empty()) {
        oss << "\nCOMMANDS:\n";
        for (const auto& sub : cmd.subcommands()) {
            std::string entry = sub.name();
            if (!sub.aliases().empty()) entry += " (" + utils::join(sub.aliases(), ", ") + ")";
            writeEntry(oss, entry, sub.about().value_or(""));
        }
        oss << "\nRun '<COMMAND> --help' for more information on a specific command.\n";
    }

    return oss.str();
}

} // namespace argtree
