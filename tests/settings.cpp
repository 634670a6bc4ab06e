#include <cassert>
#include <cstdlib>
#include "procsup/settings.hpp"

int main() {
  using namespace procsup;
  // JSON parse
  auto s = Settings::from_json(Json{{"log_file", "-"},
                                    {"kubectl_cmd", "oc"},
                                    {"verbose", true},
                                    {"cache_dir", "/tmp/procsup-cache"},
                                    {"cache_ttl_seconds", 60},
                                    {"slow_command_seconds", 2.5}});
  assert(s.log_file == "-");
  assert(s.kubectl_cmd == "oc");
  assert(s.verbose == true);
  assert(s.cache_dir == "/tmp/procsup-cache");
  assert(s.cache_ttl_seconds == 60);
  assert(s.slow_command_seconds == 2.5);

  // Defaults
  auto d = Settings::from_json(Json::object());
  assert(d.kubectl_cmd == "kubectl");
  assert(d.verbose == false);
  assert(d.cache_ttl_seconds == 12 * 60 * 60);
  assert(!d.cache_dir.empty());

  // Env parse (set locally)
  setenv("PROCSUP_LOG_FILE", "session.log", 1);
  setenv("PROCSUP_KUBECTL", "oc", 1);
  setenv("PROCSUP_VERBOSE", "TRUE", 1);
  setenv("PROCSUP_CACHE_DIR", "/tmp/elsewhere", 1);
  auto e = Settings::from_env();
  assert(e.log_file == "session.log");
  assert(e.kubectl_cmd == "oc");
  assert(e.verbose == true); // case-insensitive
  assert(e.cache_dir == "/tmp/elsewhere");

  setenv("PROCSUP_VERBOSE", "\xC3\x9C" "ber", 1);
  assert(Settings::from_env().verbose == false); // non-ASCII bytes

  setenv("PROCSUP_VERBOSE", "0", 1);
  assert(Settings::from_env().verbose == false);
  return 0;
}
