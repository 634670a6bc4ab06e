#pragma once
#include "procsup/types.hpp"

#include <stdexcept>
#include <string>

namespace procsup
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Child process exited with a nonzero status
class CommandFailed : public Error
{
  public:
    CommandFailed(Args args, int returncode, std::string output = {});

    const Args& args() const
    {
        return args_;
    }
    int returncode() const
    {
        return returncode_;
    }
    /// Captured stdout (get_output only; empty otherwise)
    const std::string& output() const
    {
        return output_;
    }

  private:
    Args args_;
    int returncode_;
    std::string output_;
};

} // namespace procsup
