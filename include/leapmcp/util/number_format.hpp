#pragma once
#include <string>

namespace leapmcp::util
{

/// Shortest decimal text that reads back as `value`, without an exponent.
/// Integral values carry no fractional part ("5", not "5.0"). Non-finite
/// values render as "inf", "-inf" and "NaN".
std::string format_number(double value);

} // namespace leapmcp::util
