#include "leapmcp/catalog.hpp"

#include "leapmcp/exceptions.hpp"
#include "leapmcp/util/json.hpp"
#include "leapmcp/util/number_format.hpp"

namespace leapmcp
{

namespace
{

double number_argument(const Json& arguments, const std::string& key)
{
    const Json* value = util::json::find_field(arguments, key);
    if (!value || !value->is_number())
        throw ValidationError("Missing '" + key + "' argument");
    return value->get<double>();
}

} // namespace

tools::Tool make_echo_tool()
{
    Json schema = {
        {"type", "object"},
        {"properties",
         {{"message", {{"type", "string"}, {"description", "The message to echo"}}}}},
        {"required", Json::array({"message"})},
    };
    return tools::Tool{"echo", "Echoes back the input message", std::move(schema),
                       [](const Json& arguments) -> std::string
                       {
                           const Json* message = util::json::find_field(arguments, "message");
                           if (!message || !message->is_string())
                               throw ValidationError("Missing 'message' argument");
                           return "Echo: " + message->get<std::string>();
                       }};
}

tools::Tool make_add_tool()
{
    Json schema = {
        {"type", "object"},
        {"properties",
         {{"a", {{"type", "number"}, {"description", "First number"}}},
          {"b", {{"type", "number"}, {"description", "Second number"}}}}},
        {"required", Json::array({"a", "b"})},
    };
    return tools::Tool{"add", "Adds two numbers together", std::move(schema),
                       [](const Json& arguments) -> std::string
                       {
                           double a = number_argument(arguments, "a");
                           double b = number_argument(arguments, "b");
                           return util::format_number(a) + " + " + util::format_number(b) +
                                  " = " + util::format_number(a + b);
                       }};
}

resources::Resource make_example_resource()
{
    resources::Resource res;
    res.uri = "file:///example.txt";
    res.name = "Example File";
    res.description = "An example text file";
    res.mime_type = "text/plain";
    res.reader = []()
    {
        return std::string("This is an example text file content.\n"
                           "It contains some sample text for demonstration purposes.");
    };
    return res;
}

prompts::Prompt make_hello_prompt()
{
    prompts::Prompt prompt;
    prompt.name = "hello";
    prompt.description = "Returns a friendly greeting";
    prompt.generator = [](const Json&) { return std::string("Hello from leap-mcp prompts!"); };
    return prompt;
}

Catalog make_catalog()
{
    Catalog catalog;
    catalog.server_info = Implementation{"leap-mcp", "0.1.0"};
    catalog.tools.register_tool(make_echo_tool());
    catalog.tools.register_tool(make_add_tool());
    catalog.resources.register_resource(make_example_resource());
    catalog.prompts.add(make_hello_prompt());
    return catalog;
}

} // namespace leapmcp
