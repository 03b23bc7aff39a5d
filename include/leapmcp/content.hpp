#pragma once
#include "leapmcp/types.hpp"

#include <string>

namespace leapmcp
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

} // namespace leapmcp
