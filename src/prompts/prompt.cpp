#include "leapmcp/prompts/prompt.hpp"

#include "leapmcp/content.hpp"
#include "leapmcp/exceptions.hpp"
#include "leapmcp/prompts/manager.hpp"

#include <utility>

namespace leapmcp::prompts
{

void to_json(Json& j, const PromptMessage& msg)
{
    Json content = Json::array();
    content.push_back(TextContent{"text", msg.text});
    j = Json{{"role", msg.role}, {"content", content}};
}

void PromptManager::add(const Prompt& p)
{
    auto it = index_.find(p.name);
    if (it != index_.end())
    {
        prompts_[it->second] = p;
        return;
    }
    index_.emplace(p.name, prompts_.size());
    prompts_.push_back(p);
}

const Prompt& PromptManager::get(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        throw NotFoundError("Unknown prompt: " + name);
    return prompts_[it->second];
}

std::vector<PromptMessage> PromptManager::render(const std::string& name,
                                                 const Json& arguments) const
{
    const auto& prompt = get(name);
    std::string text = prompt.generator ? prompt.generator(arguments) : std::string{};
    return {PromptMessage{"user", std::move(text)}};
}

} // namespace leapmcp::prompts
