#include "leapmcp/util/number_format.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace leapmcp::util
{

std::string format_number(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-inf" : "inf";

    // Fixed notation of DBL_MAX needs 309 integral digits plus sign.
    std::array<char, 400> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::fixed);
    if (ec != std::errc())
        throw std::runtime_error("number formatting failed");
    return std::string(buf.data(), end);
}

} // namespace leapmcp::util
