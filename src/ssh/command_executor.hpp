#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include "remote_shell.hpp"
#include "session.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Output side of one running command. Reads follow libssh2 conventions:
// bytes read, 0 or EAGAIN when nothing is pending, another negative value on
// a transport error.
class CommandStreams {
public:
    virtual ~CommandStreams() = default;

    virtual ssize_t read_stdout(char* buf, size_t len) = 0;
    virtual ssize_t read_stderr(char* buf, size_t len) = 0;
    virtual bool eof() = 0;
};

// Collect stdout and stderr until EOF or `deadline`. On the deadline,
// `result.timed_out` is set and the partial output is kept. Returns 0, or the
// first transport error code seen.
int drain_command_streams(CommandStreams& streams, std::chrono::steady_clock::time_point deadline,
                          CommandResult& result);

// Executes commands on fresh exec channels (no PTY) over the shared session.
// The remote login shell interprets the command text, so pipes and
// redirection behave as they would interactively.
class CommandExecutor : public RemoteShell {
public:
    explicit CommandExecutor(SessionManager& session);

    Result<CommandResult> execute(const std::string& command, int timeout_secs) override;

private:
    SessionManager& session_;

    Result<LIBSSH2_CHANNEL*> open_exec_channel(const std::string& command);

    // Close and free the channel. Bounded wait so a hung remote process
    // cannot pin the caller after a timeout.
    void release_channel(LIBSSH2_CHANNEL* ch, bool wait_for_close, int* exit_status);
};
