#include "procsup/exceptions.hpp"

#include "procsup/util/command.hpp"

namespace procsup
{

CommandFailed::CommandFailed(Args args, int returncode, std::string output)
    : Error("Command '" + util::str_command(args) + "' returned non-zero exit status " +
            std::to_string(returncode)),
      args_(std::move(args)), returncode_(returncode), output_(std::move(output))
{
}

} // namespace procsup
