#pragma once
///@file Helpers for reading profile JSON objects strictly.

#include "debstrap/libutil/json-fwd.hh"
#include "debstrap/libutil/types.hh"

#include <initializer_list>
#include <optional>
#include <string_view>

namespace debstrap {

/**
 * Throw `ConfigError` unless `json` is an object whose keys are all in
 * `allowed`.
 */
void checkObjectFields(
    const JSON & json, std::string_view what, std::initializer_list<std::string_view> allowed);

std::optional<std::string> optionalStringField(const JSON & json, const std::string & key, std::string_view what);

std::string stringField(const JSON & json, const std::string & key, std::string_view what);

bool boolField(const JSON & json, const std::string & key, std::string_view what, bool def);

/**
 * A list of strings, empty when the key is absent.
 */
Strings stringListField(const JSON & json, const std::string & key, std::string_view what);

}
