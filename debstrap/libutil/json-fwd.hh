#pragma once
///@file JSON handling (forward declarations only).

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace debstrap {

using JSON = nlohmann::json;

/**
 * Look up `key` in a JSON object, returning `nullptr` when it is absent.
 */
const JSON * get(const JSON & object, const std::string & key);

}
