#pragma once
#include "leapmcp/types.hpp"

#include <optional>
#include <string>

namespace leapmcp::jsonrpc
{

constexpr const char* kVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInternalError = -32603;

/// Identifier of the response to a line that could not be parsed.
constexpr const char* kParseErrorId = "parse_error";
/// Identifier of an internal-error response whose request carried none.
constexpr const char* kMissingId = "error";

struct Request
{
    std::string jsonrpc{kVersion};
    std::optional<Json> id; ///< Absent for notifications; a present null is kept
    std::string method;
    std::optional<Json> params; ///< JSON null is treated as absent

    bool is_notification() const
    {
        return !id.has_value();
    }
};

struct ErrorObject
{
    int code{kInternalError};
    std::string message;
};

/// Exactly one of result/error is set.
struct Response
{
    Json id;
    std::optional<Json> result;
    std::optional<ErrorObject> error;
};

/// Deserialize a request envelope from a parsed JSON value.
/// Throws leapmcp::ParseError when `j` is not an object or lacks a string
/// "jsonrpc" or "method" member. Unknown members are ignored.
Request parse_request(const Json& j);

/// Parse one input line (already trimmed) into a request envelope.
/// Throws leapmcp::ParseError carrying the parser diagnostic.
Request parse_request(const std::string& line);

Response make_result(Json id, Json result);
Response make_error(Json id, int code, std::string message);
Response make_parse_error(const std::string& diagnostic);
Response make_internal_error(const std::optional<Json>& id, const std::string& what);

/// Server-to-client message without an id.
Json make_notification(const std::string& method, Json params = Json::object());

// nlohmann::json adapters
void to_json(Json& j, const ErrorObject& error);
void to_json(Json& j, const Response& response);

} // namespace leapmcp::jsonrpc
