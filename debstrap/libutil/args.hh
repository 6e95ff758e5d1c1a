#pragma once
///@file Command line parsing.

#include "debstrap/libutil/types.hh"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace debstrap {

class Args
{
public:
    virtual ~Args() = default;

    /**
     * One-line description, shown in `--help`.
     */
    virtual std::string description() { return ""; }

    /**
     * What a flag does with the words that follow it. Built from a
     * callable taking zero, one or two strings, from a string to fill
     * in, or from a variable and the value to store in it.
     */
    class Handler
    {
        std::function<void(const std::vector<std::string> &)> apply;
        size_t arity_ = 0;

    public:
        Handler() = default;
        Handler(std::function<void()> fn);
        Handler(std::function<void(std::string)> fn);
        Handler(std::function<void(std::string, std::string)> fn);
        Handler(std::string * dest);

        template<class T>
        Handler(T * dest, T value)
            : apply([dest, value](const std::vector<std::string> &) { *dest = value; })
        {
        }

        size_t arity() const
        {
            return arity_;
        }

        void operator()(const std::vector<std::string> & words) const
        {
            apply(words);
        }
    };

    /**
     * A `--long` (and optionally `-s`) flag. `labels` name its
     * arguments in `--help`, one per word the handler takes.
     */
    struct Flag
    {
        std::string longName;
        char shortName = 0;
        std::string description;
        Strings labels;
        Handler handler;
    };

    void addFlag(Flag && flag);

    /**
     * Flags as help text, one per line, sorted by long name.
     */
    std::string showFlags() const;

protected:
    std::map<std::string, std::shared_ptr<Flag>> longFlags;
    std::map<char, std::shared_ptr<Flag>> shortFlags;

    /**
     * Consume the flag at `pos` and its arguments. Returns false if the
     * flag is unknown.
     */
    virtual bool processFlag(Strings::iterator & pos, Strings::iterator end);

    /**
     * Take one positional argument. Returns false if none is expected.
     */
    virtual bool processArg(const std::string & arg)
    {
        return false;
    }

    friend class MultiCommand;
};

/**
 * An argument parser that can be executed.
 */
struct Command : virtual public Args
{
    virtual void run() = 0;
};

using CommandMap = std::map<std::string, std::function<std::unique_ptr<Command>()>>;

/**
 * `<program> <subcommand>`: the first positional argument picks a
 * command from `commands`, which then receives the remaining flags and
 * arguments.
 */
class MultiCommand : virtual public Args
{
public:
    CommandMap commands;

    std::optional<std::pair<std::string, std::unique_ptr<Command>>> command;

    MultiCommand(CommandMap commands);

protected:
    bool processFlag(Strings::iterator & pos, Strings::iterator end) override;

    bool processArg(const std::string & arg) override;
};

/**
 * The top-level parser of a program.
 */
class RootArgs : virtual public Args
{
public:
    /**
     * Parse `cmdline` (without argv[0]), throwing `UsageError` on
     * unknown flags and stray arguments. `-abc` is read as `-a -b -c`,
     * and everything after `--` is positional.
     */
    void parseCmdline(const Strings & cmdline);
};

}
