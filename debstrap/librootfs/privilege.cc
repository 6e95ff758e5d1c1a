#include "debstrap/librootfs/privilege.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/types.hh"

namespace debstrap {

std::string_view showPrivilegeMethod(PrivilegeMethod method)
{
    switch (method) {
    case PrivilegeMethod::Sudo:
        return "sudo";
    case PrivilegeMethod::Doas:
        return "doas";
    }
    std::terminate();
}

std::optional<PrivilegeMethod> parsePrivilegeMethod(std::string_view s)
{
    if (s == "sudo") return PrivilegeMethod::Sudo;
    if (s == "doas") return PrivilegeMethod::Doas;
    return std::nullopt;
}

std::optional<PrivilegeMethod> Privilege::resolve(const std::optional<PrivilegeDefaults> & defaults) const
{
    return std::visit(overloaded {
        [&](const Inherit &) -> std::optional<PrivilegeMethod> {
            if (defaults) return defaults->method;
            return std::nullopt;
        },
        [&](const UseDefault &) -> std::optional<PrivilegeMethod> {
            if (!defaults)
                throw ValidationError(
                    "privilege: true requires defaults.privilege.method to be configured");
            return defaults->method;
        },
        [](const Disabled &) -> std::optional<PrivilegeMethod> { return std::nullopt; },
        [](const PrivilegeMethod & method) -> std::optional<PrivilegeMethod> { return method; },
    }, raw);
}

void Privilege::resolveInPlace(const std::optional<PrivilegeDefaults> & defaults)
{
    if (auto method = resolve(defaults))
        raw = *method;
    else
        raw = Disabled{};
}

bool Privilege::isResolved() const
{
    return std::holds_alternative<Disabled>(raw) || std::holds_alternative<PrivilegeMethod>(raw);
}

std::optional<PrivilegeMethod> Privilege::resolvedMethod() const
{
    if (auto method = std::get_if<PrivilegeMethod>(&raw))
        return *method;
    if (std::holds_alternative<Disabled>(raw))
        return std::nullopt;
    throw ConfigError("privilege setting was used before it was resolved against the profile defaults");
}

static PrivilegeMethod parseMethodObject(const JSON & json)
{
    for (auto & [key, _] : json.items())
        if (key != "method")
            throw ConfigError("unknown field '%s' in privilege settings, expected 'method'", key);

    auto method = get(json, "method");
    if (!method)
        throw ConfigError("privilege settings require a 'method' field");
    if (!method->is_string())
        throw ConfigError("privilege method must be a string, got %s", method->type_name());
    auto parsed = parsePrivilegeMethod(method->get<std::string>());
    if (!parsed)
        throw ConfigError(
            "unknown privilege method '%s', expected 'sudo' or 'doas'", method->get<std::string>());
    return *parsed;
}

Privilege Privilege::parse(const JSON & json)
{
    if (json.is_null())
        return Privilege{Inherit{}};
    if (json.is_boolean())
        return json.get<bool>() ? Privilege{UseDefault{}} : Privilege{Disabled{}};
    if (json.is_object())
        return Privilege{parseMethodObject(json)};
    throw ConfigError("privilege must be a boolean or an object with a 'method' field, got %s", json.type_name());
}

JSON Privilege::toJSON() const
{
    return std::visit(overloaded {
        [](const Inherit &) -> JSON { return nullptr; },
        [](const UseDefault &) -> JSON { return true; },
        [](const Disabled &) -> JSON { return false; },
        [](const PrivilegeMethod & method) -> JSON {
            return JSON{{"method", std::string(showPrivilegeMethod(method))}};
        },
    }, raw);
}

std::optional<PrivilegeDefaults> parsePrivilegeDefaults(const JSON & json)
{
    if (json.is_null())
        return std::nullopt;
    if (!json.is_object())
        throw ConfigError("defaults.privilege must be an object with a 'method' field");
    return PrivilegeDefaults{parseMethodObject(json)};
}

}
