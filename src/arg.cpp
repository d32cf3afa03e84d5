#include "argtree/arg.hpp"

#include <algorithm>

#include "argtree/utils.hpp"

namespace argtree {

std::optional<std::string> Arg::check(const std::string& value) const {
    if (!possibleValues_.empty() &&
        std::find(possibleValues_.begin(), possibleValues_.end(), value) == possibleValues_.end()) {
        return "invalid value '" + value + "', expected one of: " + utils::join(possibleValues_, ", ");
    }
    if (validator_) return validator_(value);
    return std::nullopt;
}

} // namespace argtree
