#pragma once
#include "leapmcp/exceptions.hpp"
#include "leapmcp/resources/resource.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace leapmcp::resources
{

/// Resource registry keyed by URI, listed in registration order.
class ResourceManager
{
  public:
    void register_resource(const Resource& res);

    bool has(const std::string& uri) const
    {
        return by_uri_.count(uri) > 0;
    }

    const Resource& get(const std::string& uri) const;

    const std::vector<Resource>& list() const
    {
        return resources_;
    }

    /// Text content of `uri`. Throws NotFoundError for unknown URIs.
    std::string read(const std::string& uri) const;

  private:
    std::vector<Resource> resources_;
    std::unordered_map<std::string, std::size_t> by_uri_;
};

} // namespace leapmcp::resources
