#include "sftp_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

// Retry a non-blocking libssh2 call while it reports EAGAIN, holding the
// session I/O mutex for each attempt. Gives up after SSH_CHANNEL_OPEN_SECS
// without progress and returns the last code.
template <typename Fn>
static auto retry_eagain(std::mutex& io, Fn fn) -> decltype(fn()) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    for (;;) {
        decltype(fn()) rc;
        {
            std::lock_guard<std::mutex> lock(io);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN || std::chrono::steady_clock::now() >= deadline) {
            return rc;
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
}

static const char* sftp_status_name(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:       return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:  return "permission denied";
        case LIBSSH2_FX_FAILURE:            return "failure";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left";
        case LIBSSH2_FX_QUOTA_EXCEEDED:     return "quota exceeded";
        case LIBSSH2_FX_NO_SUCH_PATH:       return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file exists";
        default:                            return "sftp error";
    }
}

SftpChannel::SftpChannel(SessionManager& session)
    : session_(session) {
}

Result<LIBSSH2_SFTP*> SftpChannel::channel() {
    if (!session_.is_active()) {
        return Result<LIBSSH2_SFTP*>::Err(ErrorKind::NotConnected, "Not connected to host");
    }
    std::string error;
    LIBSSH2_SFTP* sftp = session_.sftp(error);
    if (!sftp) {
        return Result<LIBSSH2_SFTP*>::Err(
            session_.is_active() ? ErrorKind::TransferIOError : ErrorKind::NotConnected, error);
    }
    return Result<LIBSSH2_SFTP*>::Ok(sftp);
}

std::string SftpChannel::fault(const std::string& what, const std::string& path) {
    LIBSSH2_SESSION* ssh = session_.get_raw_session();
    int rc = ssh ? libssh2_session_last_errno(ssh) : 0;
    std::string msg;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        std::string error;
        LIBSSH2_SFTP* sftp = session_.sftp(error);
        unsigned long code = sftp ? libssh2_sftp_last_error(sftp) : 0;
        msg = fmt::format("{} {}: {}", what, path, sftp_status_name(code));
    } else {
        msg = fmt::format("{} {}: {}", what, path, session_.last_error());
    }
    if (SessionManager::is_fatal_transport_error(rc)) {
        session_.invalidate(msg);
    }
    relay_log("sftp: " + msg);
    return msg;
}

Result<RemoteFileInfo> SftpChannel::stat(const std::string& remote) {
    auto ch = channel();
    if (ch.is_err()) return Result<RemoteFileInfo>::Err(ch.kind, ch.error);
    LIBSSH2_SFTP* sftp = ch.value;

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = retry_eagain(*session_.io_mutex(), [&] {
        return libssh2_sftp_stat(sftp, remote.c_str(), &attrs);
    });

    if (rc != 0) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long code = libssh2_sftp_last_error(sftp);
            if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
                return Result<RemoteFileInfo>::Err(ErrorKind::SourceNotFound,
                                                   "File not found on host: " + remote);
            }
        }
        return Result<RemoteFileInfo>::Err(ErrorKind::TransferIOError, fault("Cannot stat", remote));
    }

    RemoteFileInfo info;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        info.size = static_cast<int64_t>(attrs.filesize);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.mode = static_cast<unsigned>(attrs.permissions & 07777);
        info.has_mode = true;
        info.is_regular = LIBSSH2_SFTP_S_ISREG(attrs.permissions);
    }
    return Result<RemoteFileInfo>::Ok(info);
}

Result<int64_t> SftpChannel::get(const std::string& remote, const fs::path& local) {
    auto ch = channel();
    if (ch.is_err()) return Result<int64_t>::Err(ch.kind, ch.error);
    LIBSSH2_SFTP* sftp = ch.value;
    auto io = session_.io_mutex();
    LIBSSH2_SESSION* ssh = session_.get_raw_session();

    LIBSSH2_SFTP_HANDLE* fh = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (!fh && std::chrono::steady_clock::now() < open_deadline) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(*io);
            fh = libssh2_sftp_open(sftp, remote.c_str(), LIBSSH2_FXF_READ, 0);
            if (!fh) err = libssh2_session_last_errno(ssh);
        }
        if (fh) break;
        if (err != LIBSSH2_ERROR_EAGAIN) {
            if (err == LIBSSH2_ERROR_SFTP_PROTOCOL &&
                libssh2_sftp_last_error(sftp) == LIBSSH2_FX_NO_SUCH_FILE) {
                return Result<int64_t>::Err(ErrorKind::SourceNotFound,
                                            "File not found on host: " + remote);
            }
            return Result<int64_t>::Err(ErrorKind::TransferIOError, fault("Cannot open", remote));
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    if (!fh) {
        return Result<int64_t>::Err(ErrorKind::TransferIOError, "Timed out opening " + remote);
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        retry_eagain(*io, [&] { return libssh2_sftp_close(fh); });
        return Result<int64_t>::Err(ErrorKind::TransferIOError,
                                    "Cannot write local file: " + local.string());
    }

    std::vector<char> buf(SFTP_XFER_BUF_SIZE);
    int64_t total = 0;
    std::string failure;
    for (;;) {
        ssize_t n = retry_eagain(*io, [&] { return libssh2_sftp_read(fh, buf.data(), buf.size()); });
        if (n == 0) break;  // EOF
        if (n < 0) {
            failure = fault("Read failed for", remote);
            break;
        }
        out.write(buf.data(), n);
        if (!out) {
            failure = "Write failed for local file " + local.string();
            break;
        }
        total += n;
    }

    retry_eagain(*io, [&] { return libssh2_sftp_close(fh); });
    out.close();

    if (!failure.empty() || out.fail()) {
        std::error_code ec;
        fs::remove(local, ec);
        return Result<int64_t>::Err(ErrorKind::TransferIOError,
                                    failure.empty() ? "Failed to finish " + local.string() : failure);
    }

    relay_log(fmt::format("sftp: get {} -> {} ({} bytes)", remote, local.string(), total));
    return Result<int64_t>::Ok(total);
}

Result<int64_t> SftpChannel::put(const fs::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<int64_t>::Err(ErrorKind::SourceNotFound,
                                    "Cannot read local file: " + local.string());
    }

    auto ch = channel();
    if (ch.is_err()) return Result<int64_t>::Err(ch.kind, ch.error);
    LIBSSH2_SFTP* sftp = ch.value;
    auto io = session_.io_mutex();
    LIBSSH2_SESSION* ssh = session_.get_raw_session();

    LIBSSH2_SFTP_HANDLE* fh = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (!fh && std::chrono::steady_clock::now() < open_deadline) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(*io);
            fh = libssh2_sftp_open(sftp, remote.c_str(),
                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                   LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR);
            if (!fh) err = libssh2_session_last_errno(ssh);
        }
        if (fh) break;
        if (err != LIBSSH2_ERROR_EAGAIN) {
            return Result<int64_t>::Err(ErrorKind::TransferIOError, fault("Cannot create", remote));
        }
        platform::sleep_ms(SSH_POLL_INTERVAL_MS);
    }
    if (!fh) {
        return Result<int64_t>::Err(ErrorKind::TransferIOError, "Timed out creating " + remote);
    }

    std::vector<char> buf(SFTP_XFER_BUF_SIZE);
    int64_t total = 0;
    std::string failure;
    while (failure.empty()) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        std::streamsize sent = 0;
        while (sent < got) {
            ssize_t w = retry_eagain(*io, [&] {
                return libssh2_sftp_write(fh, buf.data() + sent, static_cast<size_t>(got - sent));
            });
            if (w < 0) {
                failure = fault("Write failed for", remote);
                break;
            }
            sent += w;
        }
        total += sent;
    }

    int close_rc = retry_eagain(*io, [&] { return libssh2_sftp_close(fh); });
    if (failure.empty() && close_rc != 0) {
        failure = fault("Close failed for", remote);
    }

    if (!failure.empty()) {
        return Result<int64_t>::Err(ErrorKind::TransferIOError, failure);
    }

    relay_log(fmt::format("sftp: put {} -> {} ({} bytes)", local.string(), remote, total));
    return Result<int64_t>::Ok(total);
}

Result<void> SftpChannel::remove(const std::string& remote) {
    auto ch = channel();
    if (ch.is_err()) return Result<void>::Err(ch.kind, ch.error);
    LIBSSH2_SFTP* sftp = ch.value;

    int rc = retry_eagain(*session_.io_mutex(), [&] {
        return libssh2_sftp_unlink(sftp, remote.c_str());
    });
    if (rc == 0) return Result<void>::Ok();

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code = libssh2_sftp_last_error(sftp);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            return Result<void>::Ok();  // already gone
        }
    }
    return Result<void>::Err(ErrorKind::TransferIOError, fault("Cannot remove", remote));
}
