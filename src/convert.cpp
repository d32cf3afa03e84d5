#include "argtree/convert.hpp"

#include <cctype>
#include <charconv>
#include <locale>
#include <sstream>
#include <system_error>

namespace argtree {

namespace {

CommandError rejected(const std::string& name, std::string_view token, const char* expected) {
    return CommandError::validation(name, "invalid value '" + std::string(token) + "', expected " + expected);
}

template <typename Int>
Converted<Int> readInteger(const std::string& name, std::string_view token, const char* expected) {
    Int value{};
    const char* last = token.data() + token.size();
    const auto [end, ec] = std::from_chars(token.data(), last, value);
    if (token.empty() || ec != std::errc() || end != last) return rejected(name, token, expected);
    return value;
}

} // namespace

template <>
Converted<bool> convertToken<bool>(const std::string& name, std::string_view token) {
    if (token == "true") return true;
    if (token == "false") return false;
    return rejected(name, token, "true or false");
}

template <>
Converted<int> convertToken<int>(const std::string& name, std::string_view token) {
    return readInteger<int>(name, token, "an integer");
}

template <>
Converted<std::int64_t> convertToken<std::int64_t>(const std::string& name, std::string_view token) {
    return readInteger<std::int64_t>(name, token, "an integer");
}

template <>
Converted<std::uint64_t> convertToken<std::uint64_t>(const std::string& name, std::string_view token) {
    return readInteger<std::uint64_t>(name, token, "a non-negative integer");
}

template <>
Converted<double> convertToken<double>(const std::string& name, std::string_view token) {
    if (token.empty() || std::isspace(static_cast<unsigned char>(token.front()))) {
        return rejected(name, token, "a number");
    }
    std::istringstream in{std::string(token)};
    in.imbue(std::locale::classic());
    double value = 0.0;
    if (!(in >> value) || in.peek() != std::istringstream::traits_type::eof()) return rejected(name, token, "a number");
    return value;
}

template <>
Converted<std::string> convertToken<std::string>(const std::string&, std::string_view token) {
    return std::string(token);
}

} // namespace argtree
