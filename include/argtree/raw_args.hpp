#ifndef ARGTREE_RAW_ARGS_HPP
#define ARGTREE_RAW_ARGS_HPP

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace argtree {

// Schema-less split of an argument vector into positionals, flags and options.
// Useful for tiny tools that do not want to declare a Command tree.
//
//   --key=value        option
//   --key value        option (value must not start with '-')
//   --key              flag
//   -abc [value]       flags a, b; c is an option when followed by a value, else a flag
//   -                  positional
//   --                 every later token is positional
class RawArgs {
public:
    static RawArgs parse(const std::vector<std::string>& argv);
    static RawArgs parse(int argc, char** argv);

    [[nodiscard]] const std::string& command() const { return command_; }
    [[nodiscard]] const std::vector<std::string>& positionals() const { return positionals_; }
    [[nodiscard]] const std::set<std::string>& flags() const { return flags_; }
    [[nodiscard]] const std::unordered_map<std::string, std::string>& options() const { return options_; }

    bool hasFlag(const std::string& name) const { return flags_.count(name) != 0; }
    std::optional<std::string> getOption(const std::string& name) const;

private:
    std::string command_;
    std::vector<std::string> positionals_;
    std::set<std::string> flags_;
    std::unordered_map<std::string, std::string> options_;
};

} // namespace argtree

#endif // ARGTREE_RAW_ARGS_HPP
