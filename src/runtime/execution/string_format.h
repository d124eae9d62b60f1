#pragma once
//
// str.format() for the lambda language
//
// Replacement fields: {} {0} {name}, each with an optional format spec
// [[fill]align][sign][0][width][,][.precision][type], type one of s d f F e E g G %.
//

#include "value.h"
#include <signal_lambda/core/constants.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace signal_lambda::runtime {

// format(value, spec)
std::string FormatValue(const Value& value, std::string_view spec,
                        std::size_t maxLength = constants::kMaxStringLength);

// Throws ResourceLimitExceeded once the result passes maxLength
std::string FormatString(std::string_view pattern, const std::vector<Value>& args,
                         const std::vector<std::pair<std::string, Value>>& kwargs,
                         std::size_t maxLength = constants::kMaxStringLength);

} // namespace signal_lambda::runtime
