#include "leapmcp/types.hpp"

#include "leapmcp/util/json.hpp"

namespace leapmcp
{

void from_json(const Json& j, Implementation& impl)
{
    util::json::require_object(j, "clientInfo");
    impl.name = util::json::require_string(j, "name");
    impl.version = util::json::require_string(j, "version");
}

void from_json(const Json& j, InitializeParams& params)
{
    util::json::require_object(j, "params");
    params.protocol_version = util::json::require_string(j, "protocolVersion");
    params.capabilities = util::json::require_object_field(j, "capabilities");
    if (const Json* info = util::json::find_field(j, "clientInfo"))
        params.client_info = info->get<Implementation>();
    else
        params.client_info.reset();
}

} // namespace leapmcp
