#pragma once
#include "leapmcp/logging.hpp"
#include "leapmcp/types.hpp"

#include <string>

namespace leapmcp
{

struct Settings
{
    std::string log_level{"INFO"};

    LogLevel level() const
    {
        return log_level_from_string(log_level);
    }

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace leapmcp
