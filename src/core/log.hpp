#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: one timestamped line per call, appended to a file so the
// terminal output of the CLI stays clean. Defaults to $TMPDIR/rexec_debug.log.
std::string rexec_log_path();
void set_rexec_log_path(const std::string& path);

void rexec_log(const std::string& msg);

// Log a finished command. Output previews are truncated; when redact is set
// only sizes are written.
void rexec_log_cmd(const std::string& label, const CommandResult& r, bool redact = false);
