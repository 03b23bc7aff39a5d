#pragma once
#include "leapmcp/prompts/prompt.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace leapmcp::prompts
{

class PromptManager
{
  public:
    void add(const Prompt& p);
    bool has(const std::string& name) const
    {
        return index_.count(name) > 0;
    }
    const Prompt& get(const std::string& name) const;

    /// Registration order.
    const std::vector<Prompt>& list() const
    {
        return prompts_;
    }

    /// Messages for prompt `name`. Throws NotFoundError for unknown names.
    std::vector<PromptMessage> render(const std::string& name, const Json& arguments) const;

  private:
    std::vector<Prompt> prompts_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace leapmcp::prompts
