#include "command_executor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>

Result<CommandResult> require_success(const Result<CommandResult>& r, const std::string& what) {
    if (r.is_err()) return r;

    const CommandResult& c = r.value;
    if (c.timed_out) {
        return Result<CommandResult>::Err(ErrorKind::CommandTimeout,
                                          fmt::format("{}: command timed out", what));
    }
    if (c.exit_code != 0) {
        std::string detail = c.stderr_data.empty() ? c.stdout_data : c.stderr_data;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) detail.pop_back();
        auto err = Result<CommandResult>::Err(ErrorKind::CommandFailed,
            fmt::format("{}: exit {}{}", what, c.exit_code, detail.empty() ? "" : ": " + detail));
        err.value = c;  // keep the captured streams for the caller
        return err;
    }
    return r;
}

int drain_command_streams(CommandStreams& streams, std::chrono::steady_clock::time_point deadline,
                          CommandResult& result) {
    char buf[SSH_READ_BUF_SIZE];

    // Drain stdout and stderr together so a chatty stderr can't stall the
    // channel window while we wait on stdout.
    bool eof = false;
    while (!eof) {
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            return 0;
        }

        ssize_t n_out = streams.read_stdout(buf, sizeof(buf));
        if (n_out > 0) result.stdout_data.append(buf, static_cast<size_t>(n_out));
        ssize_t n_err = streams.read_stderr(buf, sizeof(buf));
        if (n_err > 0) result.stderr_data.append(buf, static_cast<size_t>(n_err));

        for (ssize_t n : {n_out, n_err}) {
            if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) return static_cast<int>(n);
        }
        if (n_out > 0 || n_err > 0) continue;

        eof = streams.eof();
        if (!eof) platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    // Anything still buffered after EOF
    for (;;) {
        ssize_t n = streams.read_stdout(buf, sizeof(buf));
        if (n > 0) {
            result.stdout_data.append(buf, static_cast<size_t>(n));
            continue;
        }
        n = streams.read_stderr(buf, sizeof(buf));
        if (n > 0) {
            result.stderr_data.append(buf, static_cast<size_t>(n));
            continue;
        }
        break;
    }
    return 0;
}

// CommandStreams over a libssh2 exec channel; every call holds the io mutex.
class ChannelStreams : public CommandStreams {
public:
    ChannelStreams(LIBSSH2_CHANNEL* ch, std::mutex& io) : ch_(ch), io_(io) {}

    ssize_t read_stdout(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(io_);
        return libssh2_channel_read(ch_, buf, len);
    }

    ssize_t read_stderr(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(io_);
        return libssh2_channel_read_stderr(ch_, buf, len);
    }

    bool eof() override {
        std::lock_guard<std::mutex> lock(io_);
        return libssh2_channel_eof(ch_) != 0;
    }

private:
    LIBSSH2_CHANNEL* ch_;
    std::mutex& io_;
};

CommandExecutor::CommandExecutor(SessionManager& session)
    : session_(session) {
}

Result<LIBSSH2_CHANNEL*> CommandExecutor::open_exec_channel(const std::string& command) {
    auto io = session_.io_mutex();
    LIBSSH2_SESSION* ssh = session_.get_raw_session();

    // Open a new exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* ch = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < open_deadline) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(*io);
            ch = libssh2_channel_open_session(ssh);
            if (!ch) err = libssh2_session_last_errno(ssh);
        }
        if (ch) break;
        if (err != LIBSSH2_ERROR_EAGAIN) {
            if (SessionManager::is_fatal_transport_error(err)) {
                session_.invalidate("exec channel open failed");
            }
            return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::ConnectionError,
                                                 "Failed to open exec channel: " + session_.last_error());
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    if (!ch) {
        return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::ConnectionError,
                                             "Timed out opening exec channel");
    }

    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < exec_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io);
            rc = libssh2_channel_exec(ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    if (rc != 0) {
        release_channel(ch, false, nullptr);
        if (SessionManager::is_fatal_transport_error(rc)) {
            session_.invalidate("exec request failed");
        }
        return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::ConnectionError,
                                             fmt::format("Failed to exec command on channel ({})", rc));
    }
    return Result<LIBSSH2_CHANNEL*>::Ok(ch);
}

void CommandExecutor::release_channel(LIBSSH2_CHANNEL* ch, bool wait_for_close, int* exit_status) {
    auto io = session_.io_mutex();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_for_close ? 5 : 1);
    int rc;

    do {
        std::lock_guard<std::mutex> lock(*io);
        rc = libssh2_channel_close(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN && std::chrono::steady_clock::now() < deadline &&
             (platform::sleep_ms(SSH_POLL_INTERVAL_MS), true));

    if (wait_for_close && rc == 0) {
        do {
            std::lock_guard<std::mutex> lock(*io);
            rc = libssh2_channel_wait_closed(ch);
        } while (rc == LIBSSH2_ERROR_EAGAIN && std::chrono::steady_clock::now() < deadline &&
                 (platform::sleep_ms(SSH_POLL_INTERVAL_MS), true));
    }

    if (exit_status) {
        std::lock_guard<std::mutex> lock(*io);
        *exit_status = libssh2_channel_get_exit_status(ch);

        char* signal_name = nullptr;
        size_t signal_len = 0;
        libssh2_channel_get_exit_signal(ch, &signal_name, &signal_len,
                                        nullptr, nullptr, nullptr, nullptr);
        if (signal_name) {
            // Killed by a signal: no meaningful exit status was sent
            *exit_status = -1;
            relay_log(fmt::format("exec: command killed by SIG{}", std::string(signal_name, signal_len)));
            libssh2_free(session_.get_raw_session(), signal_name);
        }
    }

    do {
        std::lock_guard<std::mutex> lock(*io);
        rc = libssh2_channel_free(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN && std::chrono::steady_clock::now() < deadline &&
             (platform::sleep_ms(SSH_POLL_INTERVAL_MS), true));
}

Result<CommandResult> CommandExecutor::execute(const std::string& command, int timeout_secs) {
    if (!session_.is_active() || !session_.get_raw_session()) {
        return Result<CommandResult>::Err(ErrorKind::NotConnected,
                                          "Not connected to host");
    }

    auto opened = open_exec_channel(command);
    if (opened.is_err()) {
        relay_log("exec: " + opened.error);
        return Result<CommandResult>::Err(opened.kind, opened.error);
    }
    LIBSSH2_CHANNEL* ch = opened.value;
    auto io = session_.io_mutex();

    CommandResult result;
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    ChannelStreams streams(ch, *io);
    int rc = drain_command_streams(streams, deadline, result);
    if (rc != 0) {
        if (SessionManager::is_fatal_transport_error(rc)) {
            session_.invalidate("read failed during command");
        }
        release_channel(ch, false, nullptr);
        relay_log(fmt::format("exec: channel read error {} for: {}", rc, command.substr(0, 200)));
        return Result<CommandResult>::Err(ErrorKind::ConnectionError,
            fmt::format("SSH channel read error ({})", rc));
    }

    if (result.timed_out) {
        // Remote process is left to finish on its own
        release_channel(ch, false, nullptr);
        result.exit_code = -1;
        relay_log_command("exec(timeout)", command, result);
        return Result<CommandResult>::Ok(result);
    }

    int exit_status = -1;
    release_channel(ch, true, &exit_status);
    result.exit_code = exit_status;

    relay_log_command("exec", command, result);
    return Result<CommandResult>::Ok(result);
}
