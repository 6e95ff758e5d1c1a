#pragma once
///@file

#include "debstrap/libutil/args.hh"

namespace debstrap {

/**
 * Flags accepted by every debstrap command: verbosity, log format and
 * `--option` overrides of the global settings.
 */
struct MixCommonArgs : virtual Args
{
    std::string programName;

    MixCommonArgs(const std::string & programName);
};

}
