#pragma once
#include "leapmcp/types.hpp"

#include <string>

namespace leapmcp::util::json
{

using json = leapmcp::Json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}

// Field accessors for deserializing parameter objects. They throw
// leapmcp::ValidationError naming the offending field.
const json& require_object(const json& j, const std::string& what);
const json& require_field(const json& obj, const std::string& key);
std::string require_string(const json& obj, const std::string& key);
const json& require_object_field(const json& obj, const std::string& key);

/// Member `key` of `obj`, or nullptr when absent. JSON null counts as absent.
const json* find_field(const json& obj, const std::string& key);

} // namespace leapmcp::util::json
