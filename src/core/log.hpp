#pragma once

#include <string>

// Debug log. Lines go to a file, never to stdout/stderr: those are the
// streams being captured.

// Default: <temp_dir>/linecap_debug.log
std::string linecap_log_path();
void set_log_path(const std::string& path);
void set_log_enabled(bool enabled);

// Append a "[HH:MM:SS.mmm] msg" line. Safe to call from the pump thread.
void linecap_log(const std::string& msg);
