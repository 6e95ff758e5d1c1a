#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/fmt.hh"

namespace debstrap {

const JSON * get(const JSON & object, const std::string & key)
{
    auto i = object.find(key);
    if (i == object.end()) return nullptr;
    return &*i;
}

JSON json::parse(std::string_view source, std::optional<std::string_view> context)
{
    try {
        return JSON::parse(source);
    } catch (JSON::exception & e) {
        ParseError error{"failed to parse JSON: %s", e.what()};
        if (context)
            error.addTrace(HintFmt("while parsing %s", *context));
        throw error;
    }
}

}
