#pragma once
///@file
/// SGR sequences for log and error output. `filterANSIEscapes()`
/// strips them again where the output is not a terminal.

#define ANSI_NORMAL "\e[0m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"
