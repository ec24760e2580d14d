#include "session.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <cstring>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: every prompt gets the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SessionManager::SessionManager(const HostConfig& target)
    : target_(target), session_(nullptr), sftp_(nullptr), sock_(PXRELAY_INVALID_SOCKET),
      active_(false), libssh2_initialized_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
    if (libssh2_initialized_) {
        libssh2_exit();
    }
}

Result<void> SessionManager::establish(StatusCallback callback) {
    if (active_) {
        return Result<void>::Err(ErrorKind::ConnectionError,
                                 "Session already established to " + target_str_);
    }

    // Credential shape is a configuration error, checked before any I/O
    auto creds = validate_credentials(target_);
    if (creds.is_err()) return creds;

    // Leftovers of an invalidated connection
    if (session_ || sftp_ || sock_ != PXRELAY_INVALID_SOCKET) {
        close();
    }

    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    if (!libssh2_initialized_) {
        if (libssh2_init(0) != 0) {
            return Result<void>::Err(ErrorKind::ConnectionError, "Failed to initialize libssh2");
        }
        libssh2_initialized_ = true;
    }

    std::string net_error;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000, net_error);
    if (sock_ == PXRELAY_INVALID_SOCKET) {
        relay_log("session: tcp connect failed: " + net_error);
        return Result<void>::Err(ErrorKind::ConnectionError,
            fmt::format("Failed to connect to {}:{}: {}", target_.host, target_.port, net_error));
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init();
    if (!session_) {
        teardown("Session init failed");
        return Result<void>::Err(ErrorKind::ConnectionError, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    if (ret != 0) {
        std::string cause = ret == LIBSSH2_ERROR_EAGAIN ? "timed out" : last_error();
        teardown("Handshake failed");
        return Result<void>::Err(ErrorKind::ConnectionError,
                                 "SSH handshake failed with " + target_.host + ": " + cause);
    }

    platform::enable_tcp_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.is_err()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;
    relay_log(fmt::format("session: connected to {}:{}", target_str_, target_.port));

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return Result<void>::Ok();
}

Result<void> SessionManager::ssh_userauth(StatusCallback callback) {
    // Check what auth methods the server supports
    char* auth_list = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return Result<void>::Ok();  // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() > deadline) {
            break;
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (target_.ssh_key_path.has_value()) {
        return auth_publickey(callback);
    }
    return auth_password(methods, callback);
}

Result<void> SessionManager::auth_publickey(StatusCallback callback) {
    std::string key_path = expand_home(*target_.ssh_key_path).string();
    const char* passphrase = target_.key_passphrase ? target_.key_passphrase->c_str() : nullptr;

    if (callback) callback("Using public key auth (" + key_path + ")...");

    int ret;
    while ((ret = libssh2_userauth_publickey_fromfile_ex(
                session_, target_.user.c_str(), static_cast<unsigned int>(target_.user.length()),
                nullptr, key_path.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    if (ret == 0) {
        if (callback) callback("Authentication successful");
        return Result<void>::Ok();
    }
    return Result<void>::Err(ErrorKind::ConnectionError,
        fmt::format("Public key authentication failed for {}@{} (key {}): {}",
                    target_.user, target_.host, key_path, last_error()));
}

Result<void> SessionManager::auth_password(const std::string& methods, StatusCallback callback) {
    int ret = -1;

    // Try password auth
    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    // Some hosts only offer keyboard-interactive for passwords
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = *target_.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_POLL_INTERVAL_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(ErrorKind::ConnectionError,
        fmt::format("Authentication failed for {}@{} (check username/password)",
                    target_.user, target_.host));
}

LIBSSH2_SFTP* SessionManager::sftp(std::string& error) {
    if (!active_ || !session_) {
        error = "Not connected";
        return nullptr;
    }
    if (sftp_) return sftp_;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            sftp_ = libssh2_sftp_init(session_);
            if (!sftp_) {
                int rc = libssh2_session_last_errno(session_);
                if (rc != LIBSSH2_ERROR_EAGAIN) {
                    error = "Failed to open SFTP subsystem: " + last_error();
                    if (is_fatal_transport_error(rc)) {
                        active_ = false;
                    }
                    return nullptr;
                }
            }
        }
        if (sftp_) break;
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }

    if (!sftp_) {
        error = "Timed out opening SFTP subsystem";
        return nullptr;
    }
    relay_log("session: SFTP channel opened");
    return sftp_;
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != PXRELAY_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PXRELAY_INVALID_SOCKET;
    }
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    bool was_active = active_;
    active_ = false;

    // Each libssh2 call gets its own brief lock. Return codes are ignored:
    // teardown is best effort and a dead socket must not block shutdown.
    if (sftp_) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        int rc;
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_sftp_shutdown(sftp_);
        } while (rc == LIBSSH2_ERROR_EAGAIN && std::chrono::steady_clock::now() < deadline &&
                 (platform::sleep_ms(SSH_POLL_INTERVAL_MS), true));
        sftp_ = nullptr;
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != PXRELAY_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PXRELAY_INVALID_SOCKET;
    }

    if (was_active) {
        relay_log("session: disconnected from " + target_str_);
    }
}

bool SessionManager::is_active() const {
    return active_;
}

void SessionManager::invalidate(const std::string& reason) {
    if (active_) {
        relay_log("session: invalidated: " + reason);
    }
    active_ = false;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ == PXRELAY_INVALID_SOCKET) return false;

    // Send SSH keepalive and check if connection is still up
    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}

std::string SessionManager::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    int rc = libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len == 0) return fmt::format("libssh2 error {}", rc);
    return fmt::format("{} ({})", std::string(msg, static_cast<size_t>(len)), rc);
}

bool SessionManager::is_fatal_transport_error(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
           rc == LIBSSH2_ERROR_BANNER_RECV ||
           rc == LIBSSH2_ERROR_KEX_FAILURE ||
           rc == LIBSSH2_ERROR_DECRYPT;
}
