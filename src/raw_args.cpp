#include "argtree/raw_args.hpp"

namespace argtree {

namespace {

bool isValueToken(const std::vector<std::string>& argv, std::size_t i) {
    return i < argv.size() && (argv[i].empty() || argv[i].front() != '-');
}

} // namespace

RawArgs RawArgs::parse(const std::vector<std::string>& argv) {
    RawArgs out;
    if (argv.empty()) return out;
    out.command_ = argv.front();

    bool positionalOnly = false;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (positionalOnly || arg.size() < 2 || arg.front() != '-') {
            out.positionals_.push_back(arg);
            continue;
        }

        if (arg == "--") {
            positionalOnly = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            const std::string body = arg.substr(2);
            const auto eq = body.find('=');
            if (eq != std::string::npos) {
                out.options_[body.substr(0, eq)] = body.substr(eq + 1);
            } else if (isValueToken(argv, i + 1)) {
                out.options_[body] = argv[++i];
            } else {
                out.flags_.insert(body);
            }
            continue;
        }

        // -abc: only the last character may take a value.
        for (std::size_t pos = 1; pos < arg.size(); ++pos) {
            const std::string name(1, arg[pos]);
            if (pos + 1 == arg.size() && isValueToken(argv, i + 1)) {
                out.options_[name] = argv[++i];
                break;
            }
            out.flags_.insert(name);
        }
    }
    return out;
}

RawArgs RawArgs::parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
    return parse(args);
}

std::optional<std::string> RawArgs::getOption(const std::string& name) const {
    const auto it = options_.find(name);
    if (it == options_.end()) return std::nullopt;
    return it->second;
}

} // namespace argtree
