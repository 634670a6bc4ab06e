#pragma once

/// @file procsup.hpp
/// @brief Main header for procsup - subprocess supervision with per-command
/// log tracks, timing spans and structured errors
///
/// Usage:
/// @code
/// #include <procsup.hpp>
///
/// int main() {
///     auto runner = procsup::Runner::open("session.log", "kubectl", false);
///     runner->check_call({"git", "fetch"});
///     auto head = runner->get_output({"git", "rev-parse", "HEAD"});
///     auto tail = runner->popen({"tail", "-f", "/var/log/syslog"});
/// }
/// @endcode

// Core types and exceptions
#include "procsup/types.hpp"
#include "procsup/exceptions.hpp"
#include "procsup/settings.hpp"

// Process layer
#include "procsup/process.hpp"
#include "procsup/stream_pump.hpp"
#include "procsup/launcher.hpp"

// Session collaborators
#include "procsup/output.hpp"
#include "procsup/telemetry.hpp"
#include "procsup/cache.hpp"
#include "procsup/track.hpp"

// Execution modes
#include "procsup/runner.hpp"
