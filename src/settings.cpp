#include "procsup/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace procsup
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

std::string Settings::default_cache_dir()
{
    if (const char* home = std::getenv("HOME"))
        return std::string(home) + "/.cache/procsup";
    return ".procsup-cache";
}

Settings Settings::from_env()
{
    Settings s;
    s.log_file = getenv_str("PROCSUP_LOG_FILE", s.log_file);
    s.kubectl_cmd = getenv_str("PROCSUP_KUBECTL", s.kubectl_cmd);
    auto verbose = getenv_str("PROCSUP_VERBOSE", "0");
    std::transform(verbose.begin(), verbose.end(), verbose.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    s.verbose = (verbose == "1" || verbose == "true" || verbose == "yes");
    s.cache_dir = getenv_str("PROCSUP_CACHE_DIR", default_cache_dir());
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.cache_dir = default_cache_dir();
    if (j.contains("log_file"))
        s.log_file = j.at("log_file").get<std::string>();
    if (j.contains("kubectl_cmd"))
        s.kubectl_cmd = j.at("kubectl_cmd").get<std::string>();
    if (j.contains("verbose"))
        s.verbose = j.at("verbose").get<bool>();
    if (j.contains("cache_dir"))
        s.cache_dir = j.at("cache_dir").get<std::string>();
    if (j.contains("cache_ttl_seconds"))
        s.cache_ttl_seconds = j.at("cache_ttl_seconds").get<int>();
    if (j.contains("slow_command_seconds"))
        s.slow_command_seconds = j.at("slow_command_seconds").get<double>();
    return s;
}

} // namespace procsup
