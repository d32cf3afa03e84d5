#ifndef ARGTREE_CONVERT_HPP
#define ARGTREE_CONVERT_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "argtree/error.hpp"

namespace argtree {

// A typed value, or the ValidationError explaining why the text did not convert.
template <typename T>
using Converted = std::variant<T, CommandError>;

// Reads one value token of argument `name` as T.
//
//   bool           "true" or "false", the spelling a flag renders as
//   int, int64_t   decimal, optional leading '-'
//   uint64_t       decimal digits only
//   double         decimal or exponent notation
//   std::string    the token unchanged
template <typename T>
Converted<T> convertToken(const std::string& name, std::string_view token);

template <>
Converted<bool> convertToken<bool>(const std::string& name, std::string_view token);
template <>
Converted<int> convertToken<int>(const std::string& name, std::string_view token);
template <>
Converted<std::int64_t> convertToken<std::int64_t>(const std::string& name, std::string_view token);
template <>
Converted<std::uint64_t> convertToken<std::uint64_t>(const std::string& name, std::string_view token);
template <>
Converted<double> convertToken<double>(const std::string& name, std::string_view token);
template <>
Converted<std::string> convertToken<std::string>(const std::string& name, std::string_view token);

} // namespace argtree

#endif // ARGTREE_CONVERT_HPP
