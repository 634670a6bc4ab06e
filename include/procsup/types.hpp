#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace procsup
{

constexpr const char* VERSION = "0.3.0";

using Json = nlohmann::json;

/// Per-invocation correlation id, issued by TrackSequencer (first value is 1)
using Track = std::uint64_t;

using Args = std::vector<std::string>;

} // namespace procsup
