#pragma once
///@file

#include <optional>
#include <string>

namespace debstrap {

std::optional<std::string> getEnv(const std::string & key);

/** Like `getEnv`, but a variable set to "" counts as unset. */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

}
