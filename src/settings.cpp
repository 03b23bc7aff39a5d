#include "leapmcp/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace leapmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("LEAPMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    return s;
}

} // namespace leapmcp
