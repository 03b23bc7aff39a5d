#pragma once
#include "leapmcp/types.hpp"

#include <functional>
#include <string>

namespace leapmcp::prompts
{

/// MCP Prompt message
struct PromptMessage
{
    std::string role; // "user", "assistant"
    std::string text;
};

/// MCP Prompt definition
struct Prompt
{
    std::string name;
    std::string description;
    /// Produces the prompt text; receives the request "arguments" (may be null).
    std::function<std::string(const Json&)> generator;

    /// {"name", "description"} as listed by prompts/list.
    Json descriptor() const
    {
        return Json{{"name", name}, {"description", description}};
    }
};

// nlohmann::json adapters
void to_json(Json& j, const PromptMessage& msg);

} // namespace leapmcp::prompts
