#include "leapmcp/util/json.hpp"

#include "leapmcp/exceptions.hpp"

namespace leapmcp::util::json
{

const json& require_object(const json& j, const std::string& what)
{
    if (!j.is_object())
        throw ValidationError(what + " must be an object");
    return j;
}

const json* find_field(const json& obj, const std::string& key)
{
    if (!obj.is_object())
        return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

const json& require_field(const json& obj, const std::string& key)
{
    const json* value = find_field(obj, key);
    if (!value)
        throw ValidationError("missing field '" + key + "'");
    return *value;
}

std::string require_string(const json& obj, const std::string& key)
{
    const auto& value = require_field(obj, key);
    if (!value.is_string())
        throw ValidationError("field '" + key + "' must be a string");
    return value.get<std::string>();
}

const json& require_object_field(const json& obj, const std::string& key)
{
    const auto& value = require_field(obj, key);
    if (!value.is_object())
        throw ValidationError("field '" + key + "' must be an object");
    return value;
}

} // namespace leapmcp::util::json
