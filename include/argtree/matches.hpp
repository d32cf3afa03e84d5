#ifndef ARGTREE_MATCHES_HPP
#define ARGTREE_MATCHES_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "argtree/convert.hpp"

namespace argtree {

// A stored argument value: one string, an ordered sequence, or a presence flag.
class ArgValue {
public:
    using Storage = std::variant<std::string, std::vector<std::string>, bool>;

    ArgValue() : storage_(false) {}
    explicit ArgValue(std::string value) : storage_(std::move(value)) {}
    explicit ArgValue(const char* value) : storage_(std::string(value)) {}
    explicit ArgValue(std::vector<std::string> values) : storage_(std::move(values)) {}
    explicit ArgValue(bool flag) : storage_(flag) {}

    [[nodiscard]] bool isSingle() const { return std::holds_alternative<std::string>(storage_); }
    [[nodiscard]] bool isMultiple() const { return std::holds_alternative<std::vector<std::string>>(storage_); }
    [[nodiscard]] bool isFlag() const { return std::holds_alternative<bool>(storage_); }

    // nullptr when the value holds a different alternative.
    [[nodiscard]] const std::string* single() const { return std::get_if<std::string>(&storage_); }
    [[nodiscard]] const std::vector<std::string>* multiple() const {
        return std::get_if<std::vector<std::string>>(&storage_);
    }
    [[nodiscard]] const bool* flag() const { return std::get_if<bool>(&storage_); }

    std::vector<std::string>* multiple() { return std::get_if<std::vector<std::string>>(&storage_); }

    [[nodiscard]] const Storage& storage() const { return storage_; }

    // Flattened view: a single value as one element, a flag as "true"/"false".
    [[nodiscard]] std::vector<std::string> rawValues() const;

    // Conversion follows the tag: a Single converts its text, a Flag converts as "true"/"false",
    // and a sequence only when it holds exactly one value.
    template <typename T>
    Converted<T> as(const std::string& name) const {
        if (const auto* text = single()) return convertToken<T>(name, *text);
        if (const auto* set = flag()) return convertToken<T>(name, *set ? "true" : "false");
        const auto& values = *multiple();
        if (values.size() == 1) return convertToken<T>(name, values.front());
        return CommandError::validation(name, "expected one value, got " + std::to_string(values.size()));
    }

    // Every stored value converted; the first one that fails is reported.
    template <typename T>
    Converted<std::vector<T>> asList(const std::string& name) const {
        std::vector<T> out;
        for (const auto& raw : rawValues()) {
            auto one = convertToken<T>(name, raw);
            if (auto* err = std::get_if<CommandError>(&one)) return std::move(*err);
            out.push_back(std::move(std::get<T>(one)));
        }
        return out;
    }

    bool operator==(const ArgValue& other) const { return storage_ == other.storage_; }
    bool operator!=(const ArgValue& other) const { return !(*this == other); }

private:
    Storage storage_;
};

// Parse result for one command level. Owns the nested result of the matched subcommand, if any.
class Matches {
public:
    Matches() = default;
    explicit Matches(std::string commandName) : commandName_(std::move(commandName)) {}

    Matches(Matches&&) = default;
    Matches& operator=(Matches&&) = default;
    Matches(const Matches&) = delete;
    Matches& operator=(const Matches&) = delete;

    [[nodiscard]] const std::string& commandName() const { return commandName_; }
    [[nodiscard]] const std::map<std::string, ArgValue>& args() const { return args_; }

    bool isPresent(const std::string& name) const { return args_.count(name) != 0; }

    // The value of a single-valued argument. nullopt when absent or stored as a sequence/flag.
    std::optional<std::string> valueOf(const std::string& name) const;

    // True only for a flag stored as set.
    bool isFlagSet(const std::string& name) const;

    // The values of a multi-valued argument. nullopt when absent or stored as a single value/flag.
    std::optional<std::vector<std::string>> valuesOf(const std::string& name) const;

    const ArgValue* find(const std::string& name) const;

    // {token as typed, nested matches}, or nullptr when no subcommand was recognized.
    const std::pair<std::string, Matches>* subcommand() const { return subcommand_.get(); }
    std::optional<std::string> subcommandName() const;

    // Nested matches when `name` is the typed token or the matched command's canonical name.
    const Matches* subcommandMatches(const std::string& name) const;

    // Typed value of `name`. MissingArgument when absent, ValidationError when the text does not convert.
    template <typename T>
    Converted<T> valueAs(const std::string& name) const {
        const ArgValue* value = find(name);
        if (!value) return CommandError::missingArgument(name);
        return value->as<T>(name);
    }

    template <typename T>
    Converted<std::vector<T>> valuesAs(const std::string& name) const {
        const ArgValue* value = find(name);
        if (!value) return CommandError::missingArgument(name);
        return value->asList<T>(name);
    }

    // valueAs() with any error replaced by `fallback`.
    template <typename T>
    T get(const std::string& name, T fallback = T()) const {
        auto converted = valueAs<T>(name);
        if (auto* value = std::get_if<T>(&converted)) return std::move(*value);
        return fallback;
    }

private:
    friend class Parser;

    ArgValue* findMutable(const std::string& name);
    void insert(const std::string& name, ArgValue value) { args_[name] = std::move(value); }
    void setSubcommand(std::string token, Matches nested) {
        subcommand_ = std::make_unique<std::pair<std::string, Matches>>(std::move(token), std::move(nested));
    }

    std::string commandName_;
    std::map<std::string, ArgValue> args_;
    std::unique_ptr<std::pair<std::string, Matches>> subcommand_;
};

} // namespace argtree

#endif // ARGTREE_MATCHES_HPP
