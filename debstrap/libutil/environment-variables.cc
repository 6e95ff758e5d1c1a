#include "debstrap/libutil/environment-variables.hh"

#include <cstdlib>

namespace debstrap {

std::optional<std::string> getEnv(const std::string & key)
{
    if (auto value = std::getenv(key.c_str()))
        return value;
    return std::nullopt;
}

std::optional<std::string> getEnvNonEmpty(const std::string & key)
{
    auto value = getEnv(key);
    if (value && value->empty()) return std::nullopt;
    return value;
}

}
