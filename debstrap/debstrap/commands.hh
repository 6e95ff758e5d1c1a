#pragma once
///@file

#include "debstrap/libutil/args.hh"

namespace debstrap {

std::unique_ptr<Command> makeCmdApply();
std::unique_ptr<Command> makeCmdValidate();

}
