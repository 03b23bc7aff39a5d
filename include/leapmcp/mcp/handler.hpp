#pragma once
#include "leapmcp/catalog.hpp"
#include "leapmcp/jsonrpc.hpp"
#include "leapmcp/logging.hpp"
#include "leapmcp/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace leapmcp::mcp
{

/// Receives server-initiated messages (notifications) while a request is
/// being handled. The transport frames and flushes them like responses.
using NotificationSink = std::function<void(const Json&)>;

/// Routes JSON-RPC requests to MCP method handlers.
///
/// Supported methods:
/// - "initialize", "initialized"
/// - "tools/list", "tools/call"
/// - "resources/list", "resources/read"
/// - "prompts/list", "prompts/get"
///
/// Handlers throw on failure (NotFoundError, ValidationError, ...); the
/// transport turns the exception into an internal-error response. The
/// catalog and logger must outlive the dispatcher.
class Dispatcher
{
  public:
    /// Handler for one method. Returns the result payload, or nullopt when
    /// the method never answers.
    using MethodFn =
        std::function<std::optional<Json>(const std::optional<Json>&, const NotificationSink&)>;

    Dispatcher(const Catalog& catalog, const Logger& logger);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Handle one request. Returns the response envelope, or nullopt for
    /// methods that produce none. Throws NotFoundError for unknown methods.
    std::optional<jsonrpc::Response> dispatch(const jsonrpc::Request& request,
                                              const NotificationSink& notify = {}) const;

    bool has_method(const std::string& method) const
    {
        return routes_.count(method) > 0;
    }

    /// Registered method names, sorted.
    std::vector<std::string> methods() const;

    const Catalog& catalog() const
    {
        return catalog_;
    }

  private:
    void route(const std::string& method, MethodFn fn)
    {
        routes_[method] = std::move(fn);
    }

    Json handle_initialize(const std::optional<Json>& params) const;
    void handle_initialized(const NotificationSink& notify) const;
    Json handle_tools_list() const;
    Json handle_tools_call(const std::optional<Json>& params) const;
    Json handle_resources_list() const;
    Json handle_resources_read(const std::optional<Json>& params) const;
    Json handle_prompts_list() const;
    Json handle_prompts_get(const std::optional<Json>& params) const;

    const Catalog& catalog_;
    const Logger& logger_;
    std::unordered_map<std::string, MethodFn> routes_;
};

} // namespace leapmcp::mcp
