#ifndef ARGTREE_ARG_HPP
#define ARGTREE_ARG_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace argtree {

// One declared unit of input: a flag (-v), an option (--output file) or a positional (<FILE>).
//
// Setters return *this so descriptors can be built in one expression:
//
//     Arg("output").shortName('o').longName("output").help("Output file").required(true)
//
// A freshly constructed Arg takes a value; call takesValue(false) for a pure flag.
class Arg {
public:
    // Returns an empty optional when the value is accepted, otherwise the rejection message.
    using Validator = std::function<std::optional<std::string>(const std::string& value)>;

    // Index reserved for the variadic positional.
    static constexpr std::size_t kLastIndex = std::numeric_limits<std::size_t>::max();

    explicit Arg(std::string name) : name_(std::move(name)) {}

    Arg& shortName(char c) {
        short_ = c;
        return *this;
    }

    Arg& longName(std::string name) {
        long_ = std::move(name);
        return *this;
    }

    Arg& help(std::string text) {
        help_ = std::move(text);
        return *this;
    }

    Arg& required(bool v) {
        required_ = v;
        return *this;
    }

    Arg& takesValue(bool v) {
        takesValue_ = v;
        return *this;
    }

    Arg& multiple(bool v) {
        multiple_ = v;
        return *this;
    }

    Arg& defaultValue(std::string value) {
        defaultValue_ = std::move(value);
        return *this;
    }

    Arg& possibleValues(std::vector<std::string> values) {
        possibleValues_ = std::move(values);
        return *this;
    }

    Arg& possibleValues(std::initializer_list<std::string> values) {
        return possibleValues(std::vector<std::string>(values));
    }

    Arg& validator(Validator v) {
        validator_ = std::move(v);
        return *this;
    }

    // Positional slot (0-based). Ignored once last(true) is set.
    Arg& index(std::size_t i) {
        if (!last_) index_ = i;
        return *this;
    }

    // Environment variable consulted when no value was given on the command line.
    Arg& env(std::string var) {
        env_ = std::move(var);
        return *this;
    }

    Arg& requiresArg(std::string name) {
        requires_.push_back(std::move(name));
        return *this;
    }

    Arg& conflictsWith(std::string name) {
        conflicts_.push_back(std::move(name));
        return *this;
    }

    // "a,b,c" -> ["a","b","c"]. Implies multiple(true).
    Arg& valueDelimiter(char delimiter) {
        delimiter_ = delimiter;
        multiple_ = true;
        return *this;
    }

    // Variadic positional: captures every remaining positional token. Implies multiple(true).
    Arg& last(bool v) {
        last_ = v;
        if (v) {
            multiple_ = true;
            index_ = kLastIndex;
        }
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] std::optional<char> shortName() const { return short_; }
    [[nodiscard]] const std::optional<std::string>& longName() const { return long_; }
    [[nodiscard]] const std::optional<std::string>& help() const { return help_; }
    [[nodiscard]] bool required() const { return required_; }
    [[nodiscard]] bool takesValue() const { return takesValue_; }
    [[nodiscard]] bool multiple() const { return multiple_; }
    [[nodiscard]] const std::optional<std::string>& defaultValue() const { return defaultValue_; }
    [[nodiscard]] const std::vector<std::string>& possibleValues() const { return possibleValues_; }
    [[nodiscard]] const Validator& validator() const { return validator_; }
    [[nodiscard]] std::optional<std::size_t> index() const { return index_; }
    [[nodiscard]] const std::optional<std::string>& env() const { return env_; }
    [[nodiscard]] const std::vector<std::string>& requirements() const { return requires_; }
    [[nodiscard]] const std::vector<std::string>& conflicts() const { return conflicts_; }
    [[nodiscard]] std::optional<char> valueDelimiter() const { return delimiter_; }
    [[nodiscard]] bool last() const { return last_; }

    [[nodiscard]] bool isPositional() const { return index_.has_value(); }

    bool matchesShort(char c) const { return short_.has_value() && *short_ == c; }
    bool matchesLong(const std::string& key) const { return long_.has_value() && *long_ == key; }

    // Runs the possible-values check, then the custom validator, against one value.
    std::optional<std::string> check(const std::string& value) const;

private:
    std::string name_;
    std::optional<char> short_;              // -o
    std::optional<std::string> long_;        // --output
    std::optional<std::string> help_;
    bool required_{false};
    bool takesValue_{true};
    bool multiple_{false};
    std::optional<std::string> defaultValue_;
    std::vector<std::string> possibleValues_;
    Validator validator_;
    std::optional<std::size_t> index_;       // <FILE> slot, or kLastIndex
    std::optional<std::string> env_;         // APP_CONFIG
    std::vector<std::string> requires_;
    std::vector<std::string> conflicts_;
    std::optional<char> delimiter_;
    bool last_{false};
};

// Named set of mutually exclusive arguments. A required group also fails when none of its members is present.
class ArgGroup {
public:
    explicit ArgGroup(std::string name) : name_(std::move(name)) {}

    ArgGroup& arg(std::string name) {
        args_.push_back(std::move(name));
        return *this;
    }

    ArgGroup& args(std::vector<std::string> names) {
        for (auto& n : names) args_.push_back(std::move(n));
        return *this;
    }

    ArgGroup& required(bool v) {
        required_ = v;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::string>& args() const { return args_; }
    [[nodiscard]] bool required() const { return required_; }

private:
    std::string name_;
    std::vector<std::string> args_;
    bool required_{false};
};

} // namespace argtree

#endif // ARGTREE_ARG_HPP
