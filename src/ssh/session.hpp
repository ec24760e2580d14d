#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Owns the single SSH connection to the host and the SFTP sub-channel derived
// from it. Exec channels for commands are opened per call by CommandExecutor;
// the SFTP channel is opened on first use and reused until close().
class SessionManager {
public:
    explicit SessionManager(const HostConfig& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // ConfigError if the credential is ambiguous, ConnectionError otherwise.
    Result<void> establish(StatusCallback callback = nullptr);

    // SFTP first, then the SSH session, then the socket. Never fails.
    void close();

    bool is_active() const;
    bool check_alive();

    // Mark the connection dead after a transport fault. Further use fails
    // with NotConnected until the owner reconnects.
    void invalidate(const std::string& reason);

    // Lazily opened SFTP channel; nullptr with `error` filled on failure.
    LIBSSH2_SFTP* sftp(std::string& error);

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

    // Human-readable last libssh2 error (never contains credentials)
    std::string last_error() const;

    // True if the libssh2 error code means the transport itself is gone.
    static bool is_fatal_transport_error(int rc);

private:
    HostConfig target_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;
    socket_t sock_;
    bool active_;
    bool libssh2_initialized_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> ssh_userauth(StatusCallback callback);
    Result<void> auth_publickey(StatusCallback callback);
    Result<void> auth_password(const std::string& methods, StatusCallback callback);
    void teardown(const char* reason);
};
