#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure taxonomy shared by every operation.
enum class ErrorKind {
    None,
    NotConnected,       // no session, or session already closed
    ConnectionError,    // connect/auth/transport fault
    ConfigError,
    CommandTimeout,
    CommandFailed,      // non-zero exit status
    PathInvalid,
    SizeExceedsLimit,
    PermissionInvalid,
    DestinationExists,
    SourceNotFound,
    TargetNotFound,
    TransferIOError,    // SFTP-level fault during a byte copy
    IndirectionFailed,  // non-zero exit from a pct staging primitive
    HostAccessDisabled,
    Internal,
};

const char* error_kind_name(ErrorKind kind);

// PathInvalid, SizeExceedsLimit and PermissionInvalid.
bool is_validation_error(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Internal};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Internal};
    }

    template <typename U>
    static Result<void> from(const Result<U>& other) {
        return {other.success, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one remote shell invocation. Built once by the executor.
struct CommandResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = -1;
    bool timed_out = false;

    bool success() const { return exit_code == 0 && !timed_out; }
};

// Container lifecycle state as reported by `pct status`
enum class ContainerState {
    Running,
    Stopped,
    Unknown,
};

const char* container_state_name(ContainerState state);

struct ContainerInfo {
    long vmid = 0;
    ContainerState state = ContainerState::Unknown;
    std::string status;   // raw status column ("running", "stopped", ...)
    std::string name;
};

// Result of a start/stop request
struct LifecycleChange {
    long vmid = 0;
    ContainerState previous = ContainerState::Unknown;
    ContainerState current = ContainerState::Unknown;
    bool changed = false;
};

// Configuration structures
struct HostConfig {
    std::string host;
    int port = 22;
    std::string user = "root";
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> key_passphrase;
    int timeout = 10;   // connect + handshake, seconds
};

struct TransferLimits {
    int64_t max_file_size = 10LL * 1024 * 1024;
    std::string staging_prefix = "/tmp/pxrelay-";
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
