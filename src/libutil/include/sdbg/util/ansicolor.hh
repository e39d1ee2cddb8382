#pragma once
/**
 * @file
 *
 * @brief Colour escapes for messages. The loggers strip them when
 * stderr is not a terminal.
 */

#define ANSI_NORMAL "\e[0m"
#define ANSI_BOLD "\e[1m"
#define ANSI_ITALIC "\e[3m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_BLUE "\e[34;1m"
#define ANSI_WARNING "\e[35;1m"
