#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/json.hh"

#include <algorithm>

namespace debstrap {

void checkObjectFields(
    const JSON & json, std::string_view what, std::initializer_list<std::string_view> allowed)
{
    if (!json.is_object())
        throw ConfigError("%s must be an object, got %s", what, json.type_name());
    for (auto & [key, _] : json.items())
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end())
            throw ConfigError("unknown field '%s' in %s", key, what);
}

std::optional<std::string> optionalStringField(const JSON & json, const std::string & key, std::string_view what)
{
    auto value = get(json, key);
    if (!value || value->is_null())
        return std::nullopt;
    if (!value->is_string())
        throw ConfigError("'%s' in %s must be a string, got %s", key, what, value->type_name());
    return value->get<std::string>();
}

std::string stringField(const JSON & json, const std::string & key, std::string_view what)
{
    auto value = optionalStringField(json, key, what);
    if (!value)
        throw ConfigError("%s requires a '%s' field", what, key);
    return *value;
}

bool boolField(const JSON & json, const std::string & key, std::string_view what, bool def)
{
    auto value = get(json, key);
    if (!value || value->is_null())
        return def;
    if (!value->is_boolean())
        throw ConfigError("'%s' in %s must be a boolean, got %s", key, what, value->type_name());
    return value->get<bool>();
}

Strings stringListField(const JSON & json, const std::string & key, std::string_view what)
{
    Strings res;
    auto value = get(json, key);
    if (!value || value->is_null())
        return res;
    if (!value->is_array())
        throw ConfigError("'%s' in %s must be a list, got %s", key, what, value->type_name());
    for (auto & item : *value) {
        if (!item.is_string())
            throw ConfigError("'%s' in %s must only contain strings, got %s", key, what, item.type_name());
        res.push_back(item.get<std::string>());
    }
    return res;
}

}
