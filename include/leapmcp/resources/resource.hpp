#pragma once
#include "leapmcp/types.hpp"

#include <functional>
#include <string>

namespace leapmcp::resources
{

/// MCP Resource definition
struct Resource
{
    std::string uri;                    // e.g., "file:///example.txt"
    std::string name;                   // Human-readable name
    std::string description;
    std::string mime_type;              // MIME type advertised by resources/list
    std::function<std::string()> reader; // Text content provider

    /// {"uri", "name", "description", "mimeType"} as listed by resources/list.
    Json descriptor() const
    {
        return Json{
            {"uri", uri}, {"name", name}, {"description", description}, {"mimeType", mime_type}};
    }
};

} // namespace leapmcp::resources
