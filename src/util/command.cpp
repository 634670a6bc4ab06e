#include "procsup/util/command.hpp"

#include <cctype>

namespace procsup::util
{

std::string shell_quote(const std::string& arg)
{
    if (arg.empty())
        return "''";

    bool safe = true;
    for (unsigned char c : arg)
    {
        if (!(std::isalnum(c) || c == '@' || c == '%' || c == '+' || c == '=' || c == ':' ||
              c == ',' || c == '.' || c == '/' || c == '-' || c == '_'))
        {
            safe = false;
            break;
        }
    }
    if (safe)
        return arg;

    std::string quoted = "'";
    for (char c : arg)
    {
        if (c == '\'')
            quoted += "'\"'\"'";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string str_command(const Args& args)
{
    std::string result;
    for (const auto& arg : args)
    {
        if (!result.empty())
            result += ' ';
        result += shell_quote(arg);
    }
    return result;
}

} // namespace procsup::util
