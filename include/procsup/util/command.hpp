#pragma once
#include "procsup/types.hpp"

#include <string>

namespace procsup::util
{

/// Quote a single argument for display in a POSIX shell
std::string shell_quote(const std::string& arg);

/// Render an argument vector as a copy-pasteable shell command line
std::string str_command(const Args& args);

} // namespace procsup::util
