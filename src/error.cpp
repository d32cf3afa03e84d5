#include "argtree/error.hpp"

namespace argtree {

std::string CommandError::message() const {
    switch (kind_) {
        case Kind::MissingArgument: return "the argument '" + arg_ + "' is required";
        case Kind::UnknownArgument: return "unknown argument '" + arg_ + "'";
        case Kind::UnknownSubcommand: return "unknown subcommand '" + arg_ + "'";
        case Kind::ValidationError: return "validation failed for '" + arg_ + "': " + detail_;
        case Kind::ArgumentConflict: return "the argument '" + arg_ + "' cannot be used with '" + detail_ + "'";
        case Kind::MissingDependency: return "the argument '" + arg_ + "' requires '" + detail_ + "'";
        case Kind::HelpRequested: return "help requested";
        case Kind::VersionRequested: return "version requested";
    }
    return "unknown error";
}

const char* toString(CommandError::Kind kind) {
    switch (kind) {
        case CommandError::Kind::MissingArgument: return "MissingArgument";
        case CommandError::Kind::UnknownArgument: return "UnknownArgument";
        case CommandError::Kind::UnknownSubcommand: return "UnknownSubcommand";
        case CommandError::Kind::ValidationError: return "ValidationError";
        case CommandError::Kind::ArgumentConflict: return "ArgumentConflict";
        case CommandError::Kind::MissingDependency: return "MissingDependency";
        case CommandError::Kind::HelpRequested: return "HelpRequested";
        case CommandError::Kind::VersionRequested: return "VersionRequested";
    }
    return "Unknown";
}

} // namespace argtree
