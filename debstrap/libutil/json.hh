#pragma once
///@file

#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/json-fwd.hh" // IWYU pragma: export
#include <nlohmann/json.hpp> // IWYU pragma: export
#include <optional>
#include <string_view>

namespace debstrap::json {

MakeError(ParseError, Error);

/**
 * Parse a JSON document, turning nlohmann's exceptions into a
 * `ParseError`. `context` names the document in the error trace.
 */
JSON parse(std::string_view source, std::optional<std::string_view> context = {});

}
