#include "leapmcp/resources/manager.hpp"

namespace leapmcp::resources
{

void ResourceManager::register_resource(const Resource& res)
{
    auto it = by_uri_.find(res.uri);
    if (it != by_uri_.end())
    {
        resources_[it->second] = res;
        return;
    }
    by_uri_.emplace(res.uri, resources_.size());
    resources_.push_back(res);
}

const Resource& ResourceManager::get(const std::string& uri) const
{
    auto it = by_uri_.find(uri);
    if (it == by_uri_.end())
        throw NotFoundError("Resource not found: " + uri);
    return resources_[it->second];
}

std::string ResourceManager::read(const std::string& uri) const
{
    const auto& res = get(uri);
    if (!res.reader)
        return std::string{};
    return res.reader();
}

} // namespace leapmcp::resources
