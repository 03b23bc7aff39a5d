#pragma once
#include "leapmcp/types.hpp"

#include <functional>
#include <string>

namespace leapmcp::tools
{

/// A named tool with a JSON-Schema input description.
///
/// invoke() receives the "arguments" object of a tools/call request and
/// returns the text placed in the result's content item. Failures are
/// reported by throwing (typically leapmcp::ValidationError).
class Tool
{
  public:
    using Fn = std::function<std::string(const leapmcp::Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, leapmcp::Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const leapmcp::Json& input_schema() const
    {
        return input_schema_;
    }
    std::string invoke(const leapmcp::Json& arguments) const
    {
        return fn_(arguments);
    }

    /// {"name", "description", "inputSchema"} as listed by tools/list.
    leapmcp::Json descriptor() const
    {
        return leapmcp::Json{
            {"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
    }

  private:
    std::string name_;
    std::string description_;
    leapmcp::Json input_schema_;
    Fn fn_;
};

} // namespace leapmcp::tools
