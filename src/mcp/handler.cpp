#include "leapmcp/mcp/handler.hpp"

#include "leapmcp/content.hpp"
#include "leapmcp/exceptions.hpp"
#include "leapmcp/util/json.hpp"

#include <algorithm>

namespace leapmcp::mcp
{

static const Json& require_params(const std::optional<Json>& params)
{
    if (!params)
        throw ValidationError("Missing params");
    return util::json::require_object(*params, "params");
}

static Json server_capabilities()
{
    return Json{
        {"tools", Json{{"listChanged", true}}},
        {"resources", Json{{"listChanged", true}}},
        {"prompts", Json{{"listChanged", true}}},
    };
}

Dispatcher::Dispatcher(const Catalog& catalog, const Logger& logger)
    : catalog_(catalog), logger_(logger)
{
    route("initialize",
          [this](const std::optional<Json>& params, const NotificationSink&)
          { return std::optional<Json>(handle_initialize(params)); });
    route("initialized",
          [this](const std::optional<Json>&, const NotificationSink& notify)
          {
              handle_initialized(notify);
              return std::optional<Json>();
          });
    route("tools/list", [this](const std::optional<Json>&, const NotificationSink&)
          { return std::optional<Json>(handle_tools_list()); });
    route("tools/call", [this](const std::optional<Json>& params, const NotificationSink&)
          { return std::optional<Json>(handle_tools_call(params)); });
    route("resources/list", [this](const std::optional<Json>&, const NotificationSink&)
          { return std::optional<Json>(handle_resources_list()); });
    route("resources/read", [this](const std::optional<Json>& params, const NotificationSink&)
          { return std::optional<Json>(handle_resources_read(params)); });
    route("prompts/list", [this](const std::optional<Json>&, const NotificationSink&)
          { return std::optional<Json>(handle_prompts_list()); });
    route("prompts/get", [this](const std::optional<Json>& params, const NotificationSink&)
          { return std::optional<Json>(handle_prompts_get(params)); });
}

std::optional<jsonrpc::Response> Dispatcher::dispatch(const jsonrpc::Request& request,
                                                      const NotificationSink& notify) const
{
    auto it = routes_.find(request.method);
    if (it == routes_.end())
        throw NotFoundError("Unknown method: " + request.method);

    auto result = it->second(request.params, notify);
    if (!result)
        return std::nullopt;
    return jsonrpc::make_result(request.id ? *request.id : Json(), std::move(*result));
}

std::vector<std::string> Dispatcher::methods() const
{
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& kv : routes_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

Json Dispatcher::handle_initialize(const std::optional<Json>& params) const
{
    auto init = (params ? *params : Json::object()).get<InitializeParams>();
    logger_.info("Initializing MCP server with protocol version: " + init.protocol_version);
    if (init.client_info)
        logger_.debug("Client: " + init.client_info->name + " " + init.client_info->version);

    return Json{
        {"protocolVersion", kProtocolVersion},
        {"capabilities", server_capabilities()},
        {"serverInfo", catalog_.server_info},
    };
}

void Dispatcher::handle_initialized(const NotificationSink& notify) const
{
    logger_.info("Received initialized notification");
    if (!notify)
        return;
    notify(jsonrpc::make_notification("tools/listChanged"));
    notify(jsonrpc::make_notification("resources/listChanged"));
    notify(jsonrpc::make_notification("prompts/listChanged"));
}

Json Dispatcher::handle_tools_list() const
{
    logger_.info("Listing tools");
    Json tools_array = Json::array();
    for (const auto& tool : catalog_.tools.list())
        tools_array.push_back(tool.descriptor());
    return Json{{"tools", tools_array}};
}

Json Dispatcher::handle_tools_call(const std::optional<Json>& params) const
{
    const auto& p = require_params(params);
    std::string name = util::json::require_string(p, "name");
    const auto& arguments = util::json::require_object_field(p, "arguments");
    logger_.info("Calling tool: " + name);

    std::string text = catalog_.tools.invoke(name, arguments);

    Json content = Json::array();
    content.push_back(TextContent{"text", std::move(text)});
    return Json{{"content", content}, {"isError", false}};
}

Json Dispatcher::handle_resources_list() const
{
    logger_.info("Listing resources");
    Json resources_array = Json::array();
    for (const auto& res : catalog_.resources.list())
        resources_array.push_back(res.descriptor());
    return Json{{"resources", resources_array}};
}

Json Dispatcher::handle_resources_read(const std::optional<Json>& params) const
{
    const auto& p = require_params(params);
    std::string uri = util::json::require_string(p, "uri");
    logger_.info("Reading resource: " + uri);

    std::string text = catalog_.resources.read(uri);

    // Reads always report text/plain, whatever the descriptor advertises.
    Json content = {{"uri", uri}, {"mimeType", "text/plain"}, {"text", text}};
    Json contents = Json::array();
    contents.push_back(std::move(content));
    return Json{{"contents", contents}};
}

Json Dispatcher::handle_prompts_list() const
{
    logger_.info("Listing prompts");
    Json prompts_array = Json::array();
    for (const auto& prompt : catalog_.prompts.list())
        prompts_array.push_back(prompt.descriptor());
    return Json{{"prompts", prompts_array}};
}

Json Dispatcher::handle_prompts_get(const std::optional<Json>& params) const
{
    const auto& p = require_params(params);
    std::string name = util::json::require_string(p, "name");
    logger_.info("Getting prompt: " + name);

    // "arguments" is accepted but none of the shipped prompts read it.
    const Json* arguments = util::json::find_field(p, "arguments");
    auto messages = catalog_.prompts.render(name, arguments ? *arguments : Json());

    Json messages_array = Json::array();
    for (const auto& msg : messages)
        messages_array.push_back(msg);
    return Json{{"messages", messages_array}};
}

} // namespace leapmcp::mcp
