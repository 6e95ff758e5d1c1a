#include "debstrap/libutil/args.hh"
#include "debstrap/libutil/error.hh"
#include "debstrap/libutil/strings.hh"

#include <cctype>

namespace debstrap {

Args::Handler::Handler(std::function<void()> fn)
    : apply([fn{std::move(fn)}](const std::vector<std::string> &) { fn(); })
{
}

Args::Handler::Handler(std::function<void(std::string)> fn)
    : apply([fn{std::move(fn)}](const std::vector<std::string> & words) { fn(words[0]); })
    , arity_(1)
{
}

Args::Handler::Handler(std::function<void(std::string, std::string)> fn)
    : apply([fn{std::move(fn)}](const std::vector<std::string> & words) { fn(words[0], words[1]); })
    , arity_(2)
{
}

Args::Handler::Handler(std::string * dest)
    : apply([dest](const std::vector<std::string> & words) { *dest = words[0]; })
    , arity_(1)
{
}

void Args::addFlag(Flag && flag)
{
    auto shared = std::make_shared<Flag>(std::move(flag));
    longFlags.insert_or_assign(shared->longName, shared);
    if (shared->shortName)
        shortFlags.insert_or_assign(shared->shortName, shared);
}

bool Args::processFlag(Strings::iterator & pos, Strings::iterator end)
{
    std::shared_ptr<Flag> flag;
    if (pos->starts_with("--")) {
        if (auto i = longFlags.find(pos->substr(2)); i != longFlags.end())
            flag = i->second;
    } else if (pos->size() == 2) {
        if (auto i = shortFlags.find((*pos)[1]); i != shortFlags.end())
            flag = i->second;
    }
    if (!flag) return false;

    auto name = *pos++;
    std::vector<std::string> words;
    while (words.size() < flag->handler.arity()) {
        if (pos == end)
            throw UsageError(
                "flag '%s' takes %d argument(s), got %d", name, flag->handler.arity(), words.size());
        words.push_back(*pos++);
    }
    flag->handler(words);
    return true;
}

std::string Args::showFlags() const
{
    constexpr size_t column = 32;

    std::string res;
    for (auto & [name, flag] : longFlags) {
        std::string line = flag->shortName ? fmt("  -%c, --%s", flag->shortName, name) : "      --" + name;
        for (auto & label : flag->labels)
            line += " <" + label + ">";
        line += line.size() < column ? std::string(column - line.size(), ' ') : "  ";
        res += line + trim(flag->description) + "\n";
    }
    return res;
}

MultiCommand::MultiCommand(CommandMap commands)
    : commands(std::move(commands))
{
}

bool MultiCommand::processFlag(Strings::iterator & pos, Strings::iterator end)
{
    if (Args::processFlag(pos, end)) return true;
    return command && command->second->processFlag(pos, end);
}

bool MultiCommand::processArg(const std::string & arg)
{
    if (command)
        return command->second->processArg(arg);

    auto i = commands.find(arg);
    if (i == commands.end())
        throw UsageError("'%s' is not a recognised command", arg);
    command = {arg, i->second()};
    return true;
}

static bool isLetter(char c)
{
    return std::isalpha(static_cast<unsigned char>(c));
}

/**
 * `-vvf` as `-v -v -f`. Anything from the first non-letter on stays
 * one word, the argument of the flag before it.
 */
static Strings splitShortFlags(const std::string & group)
{
    Strings res;
    size_t i = 1;
    for (; i < group.size() && isLetter(group[i]); ++i)
        res.push_back(std::string{'-', group[i]});
    if (i < group.size())
        res.push_back(group.substr(i));
    return res;
}

void RootArgs::parseCmdline(const Strings & args)
{
    Strings cmdline(args);
    bool onlyPositional = false;

    for (auto pos = cmdline.begin(); pos != cmdline.end(); ) {
        if (onlyPositional || pos->size() < 2 || (*pos)[0] != '-') {
            if (!processArg(*pos))
                throw UsageError("unexpected argument '%1%'", *pos);
            ++pos;
            continue;
        }

        if (*pos == "--") {
            onlyPositional = true;
            ++pos;
            continue;
        }

        if (pos->size() > 2 && isLetter((*pos)[1])) {
            auto split = splitShortFlags(*pos);
            pos = cmdline.erase(pos);
            pos = cmdline.insert(pos, split.begin(), split.end());
        }

        auto flag = *pos;
        if (!processFlag(pos, cmdline.end()))
            throw UsageError("unrecognised flag '%1%'", flag);
    }
}

}
