#pragma once
///@file ANSI escape sequences used in diagnostics.

#define ANSI_NORMAL "\e[0m"
#define ANSI_FAINT "\e[2m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_MAGENTA "\e[35;1m"
#define ANSI_WARNING ANSI_MAGENTA
