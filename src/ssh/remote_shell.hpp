#pragma once

#include <string>
#include <core/types.hpp>

// Runs one shell command on the host.
//
// Contract:
//   - Ok(CommandResult) whenever the command was dispatched, including
//     non-zero exits and timeouts (timed_out = true, partial output kept).
//   - Err(NotConnected) if there is no live session; nothing is sent.
//   - Err(ConnectionError) if the transport failed mid-command.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    virtual Result<CommandResult> execute(const std::string& command, int timeout_secs) = 0;
};

// Turn a dispatched command into a typed failure unless it exited 0.
// CommandTimeout if it was cut short, CommandFailed (exit code + stderr) otherwise.
Result<CommandResult> require_success(const Result<CommandResult>& r, const std::string& what);
