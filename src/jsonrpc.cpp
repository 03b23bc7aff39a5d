#include "leapmcp/jsonrpc.hpp"

#include "leapmcp/exceptions.hpp"
#include "leapmcp/util/json.hpp"

namespace leapmcp::jsonrpc
{

Request parse_request(const Json& j)
{
    if (!j.is_object())
        throw ParseError("request must be a JSON object");

    auto version_it = j.find("jsonrpc");
    if (version_it == j.end())
        throw ParseError("missing field 'jsonrpc'");
    if (!version_it->is_string())
        throw ParseError("field 'jsonrpc' must be a string");

    auto method_it = j.find("method");
    if (method_it == j.end())
        throw ParseError("missing field 'method'");
    if (!method_it->is_string())
        throw ParseError("field 'method' must be a string");

    Request request;
    request.jsonrpc = version_it->get<std::string>();
    request.method = method_it->get<std::string>();

    auto id_it = j.find("id");
    if (id_it != j.end())
        request.id = *id_it;

    auto params_it = j.find("params");
    if (params_it != j.end() && !params_it->is_null())
        request.params = *params_it;

    return request;
}

Request parse_request(const std::string& line)
{
    Json j;
    try
    {
        j = util::json::parse(line);
    }
    catch (const Json::exception& e)
    {
        throw ParseError(e.what());
    }
    return parse_request(j);
}

Response make_result(Json id, Json result)
{
    Response response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

Response make_error(Json id, int code, std::string message)
{
    Response response;
    response.id = std::move(id);
    response.error = ErrorObject{code, std::move(message)};
    return response;
}

Response make_parse_error(const std::string& diagnostic)
{
    return make_error(kParseErrorId, kParseError, "Parse error: " + diagnostic);
}

Response make_internal_error(const std::optional<Json>& id, const std::string& what)
{
    return make_error(id ? *id : Json(kMissingId), kInternalError, "Internal error: " + what);
}

Json make_notification(const std::string& method, Json params)
{
    return Json{{"jsonrpc", kVersion}, {"method", method}, {"params", std::move(params)}};
}

void to_json(Json& j, const ErrorObject& error)
{
    j = Json{{"code", error.code}, {"message", error.message}};
}

void to_json(Json& j, const Response& response)
{
    j = Json{{"jsonrpc", kVersion}, {"id", response.id}};
    if (response.result)
        j["result"] = *response.result;
    if (response.error)
        j["error"] = *response.error;
}

} // namespace leapmcp::jsonrpc
