#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace leapmcp
{

/// Objects keep their members in construction order when serialized.
using Json = nlohmann::ordered_json;

constexpr const char* kProtocolVersion = "2024-11-05";

/// Name/version pair used for both serverInfo and clientInfo.
struct Implementation
{
    std::string name;
    std::string version;
};

/// Parameters of an "initialize" request.
struct InitializeParams
{
    std::string protocol_version;
    Json capabilities = Json::object();
    std::optional<Implementation> client_info;
};

// nlohmann::json adapters
inline void to_json(Json& j, const Implementation& impl)
{
    j = Json{{"name", impl.name}, {"version", impl.version}};
}

void from_json(const Json& j, Implementation& impl);
void from_json(const Json& j, InitializeParams& params);

} // namespace leapmcp
