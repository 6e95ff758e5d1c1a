#pragma once
///@file

#include "debstrap/libutil/types.hh"

#include <functional>

namespace debstrap {

/**
 * Register the global settings, load the configuration files and set
 * up the process for running external commands.
 */
void initDebstrap();

/**
 * Print the version and configuration file locations, then exit.
 */
[[noreturn]] void printVersion(const std::string & programName);

/**
 * Run `fun`, reporting any debstrap error through the logger. Returns
 * the exit status for `main`.
 */
int handleExceptions(const std::string & programName, std::function<void()> fun);

}
