#pragma once
#include "procsup/types.hpp"

#include <string>

namespace procsup
{

struct Settings
{
    std::string log_file{"procsup.log"};
    std::string kubectl_cmd{"kubectl"};
    bool verbose{false};
    std::string cache_dir;
    int cache_ttl_seconds{12 * 60 * 60};
    /// Successful synchronous commands slower than this get a completion line
    double slow_command_seconds{1.0};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// "$HOME/.cache/procsup", or ".procsup-cache" without HOME
    static std::string default_cache_dir();
};

} // namespace procsup
