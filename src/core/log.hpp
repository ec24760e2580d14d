#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: <tmp>/pxrelay_debug.log unless the config names another file.
std::string relay_log_path();
void set_relay_log_path(const std::string& path);

// Append a timestamped line to the debug log. Never throws.
void relay_log(const std::string& msg);

// Log a remote command with its exit status and the head of its output.
void relay_log_command(const std::string& label, const std::string& cmd,
                       const CommandResult& r);
