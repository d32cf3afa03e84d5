#ifndef ARGTREE_VALIDATORS_HPP
#define ARGTREE_VALIDATORS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "argtree/arg.hpp"
#include "argtree/convert.hpp"

namespace argtree {

namespace detail {

// The conversion's rejection message, which Arg::check reports under the argument's name.
template <typename T>
std::optional<std::string> conversionProblem(const std::string& value) {
    const auto converted = convertToken<T>({}, value);
    if (const auto* err = std::get_if<CommandError>(&converted)) return err->detail();
    return std::nullopt;
}

} // namespace detail

inline Arg::Validator IsInteger() {
    return [](const std::string& v) { return detail::conversionProblem<std::int64_t>(v); };
}

inline Arg::Validator IsUnsigned() {
    return [](const std::string& v) { return detail::conversionProblem<std::uint64_t>(v); };
}

// Inclusive bounds.
inline Arg::Validator InRange(std::int64_t lo, std::int64_t hi) {
    return [lo, hi](const std::string& v) -> std::optional<std::string> {
        const auto converted = convertToken<std::int64_t>({}, v);
        if (const auto* err = std::get_if<CommandError>(&converted)) return err->detail();
        const std::int64_t n = std::get<std::int64_t>(converted);
        if (n < lo || n > hi) {
            return "value " + std::to_string(n) + " is out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]";
        }
        return std::nullopt;
    };
}

inline Arg::Validator NonEmpty() {
    return [](const std::string& v) -> std::optional<std::string> {
        if (!v.empty()) return std::nullopt;
        return std::string("value must not be empty");
    };
}

} // namespace argtree

#endif // ARGTREE_VALIDATORS_HPP
