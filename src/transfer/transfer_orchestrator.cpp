#include "transfer_orchestrator.hpp"
#include "validators.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/shell_quote.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

static Result<TransferOutcome> failed(TransferOutcome& outcome, ErrorKind kind, const std::string& msg) {
    mark_failed(outcome);
    relay_log(fmt::format("transfer {} failed ({}): {}",
                          transfer_direction_name(outcome.direction), error_kind_name(kind), msg));
    auto r = Result<TransferOutcome>::Err(kind, msg);
    r.value = outcome;
    return r;
}

template <typename T>
static Result<TransferOutcome> failed(TransferOutcome& outcome, const Result<T>& cause) {
    return failed(outcome, cause.kind, cause.error);
}

static void log_done(const TransferOutcome& o) {
    relay_log(fmt::format("transfer {}: {} -> {} ({} bytes, {}{})",
                          transfer_direction_name(o.direction), o.source, o.destination,
                          o.bytes_transferred, transfer_state_name(o.state),
                          o.warnings.empty() ? "" : fmt::format(", {} warning(s)", o.warnings.size())));
}

TransferOrchestrator::TransferOrchestrator(RemoteShell& shell, FileChannel& files,
                                           ContainerAdapter& adapter, const TransferLimits& limits)
    : shell_(shell), files_(files), adapter_(adapter), limits_(limits) {
}

std::string TransferOrchestrator::make_staging_path() const {
    return limits_.staging_prefix + random_hex_token();
}

// ── Local-side checks ──────────────────────────────────────

Result<void> TransferOrchestrator::check_local_destination(const fs::path& local, bool overwrite) {
    std::error_code ec;
    if (fs::exists(local, ec)) {
        if (fs::is_directory(local, ec)) {
            return Result<void>::Err(ErrorKind::PathInvalid,
                                     "Local path is a directory: " + local.string());
        }
        if (!overwrite) {
            return Result<void>::Err(ErrorKind::DestinationExists,
                "Local file already exists: " + local.string() + " (use overwrite to replace it)");
        }
    }

    fs::path parent = local.parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        return Result<void>::Err(ErrorKind::PathInvalid,
                                 "Local directory does not exist: " + parent.string());
    }
    return Result<void>::Ok();
}

Result<int64_t> TransferOrchestrator::check_local_source(const fs::path& local) {
    std::error_code ec;
    if (!fs::exists(local, ec)) {
        return Result<int64_t>::Err(ErrorKind::SourceNotFound,
                                    "Local file not found: " + local.string());
    }
    if (!fs::is_regular_file(local, ec)) {
        return Result<int64_t>::Err(ErrorKind::PathInvalid,
                                    "Local path is not a regular file: " + local.string());
    }
    auto size = fs::file_size(local, ec);
    if (ec) {
        return Result<int64_t>::Err(ErrorKind::SourceNotFound,
                                    "Cannot read size of " + local.string() + ": " + ec.message());
    }
    return Result<int64_t>::Ok(static_cast<int64_t>(size));
}

Result<void> TransferOrchestrator::preflight_download(const std::string& remote_path,
                                                      const std::string& remote_label,
                                                      const std::string& local_path, bool overwrite) {
    auto v = validate_path(remote_path, remote_label);
    if (v.is_err()) return v;
    v = validate_path(local_path, "local path");
    if (v.is_err()) return v;
    return check_local_destination(local_path, overwrite);
}

Result<void> TransferOrchestrator::preflight_upload(const std::string& local_path,
                                                    const std::string& remote_path,
                                                    const std::string& remote_label,
                                                    const std::string& permissions,
                                                    int64_t max_file_size) {
    auto v = validate_path(local_path, "local path");
    if (v.is_err()) return v;
    v = validate_path(remote_path, remote_label);
    if (v.is_err()) return v;
    v = validate_permissions(permissions);
    if (v.is_err()) return v;

    auto size = check_local_source(local_path);
    if (size.is_err()) return Result<void>::from(size);
    return check_size(size.value, max_file_size);
}

Result<bool> TransferOrchestrator::host_file_exists(const std::string& path) {
    auto r = shell_.execute(fmt::format("test -f {}", shell_quote(path)), SSH_CMD_TIMEOUT_SECS);
    if (r.is_err()) return Result<bool>::Err(r.kind, r.error);
    if (r.value.exit_code == 0 && !r.value.timed_out) return Result<bool>::Ok(true);
    if (r.value.exit_code == 1) return Result<bool>::Ok(false);

    auto checked = require_success(r, "test -f " + path);
    return Result<bool>::Err(checked.kind, checked.error);
}

Result<int64_t> TransferOrchestrator::fetch_to_local(const std::string& remote, const fs::path& local) {
    fs::path part = local;
    part += ".pxrelay-" + random_hex_token(4);

    auto got = files_.get(remote, part);
    std::error_code ec;
    if (got.is_err()) {
        fs::remove(part, ec);
        return got;
    }

    fs::rename(part, local, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(part, ignore);
        return Result<int64_t>::Err(ErrorKind::TransferIOError,
            fmt::format("Cannot move download into place at {}: {}", local.string(), ec.message()));
    }
    return got;
}

void TransferOrchestrator::apply_local_mode(const fs::path& local, unsigned mode, TransferOutcome& outcome) {
    std::error_code ec;
    fs::permissions(local, static_cast<fs::perms>(mode & 07777), fs::perm_options::replace, ec);
    if (ec) {
        outcome.warnings.push_back(fmt::format("Could not set mode {:o} on {}: {}",
                                               mode & 07777, local.string(), ec.message()));
        relay_log("transfer warning: " + outcome.warnings.back());
        return;
    }
    outcome.mode = mode & 07777;
}

// ── Staged (container) transfers ───────────────────────────

Result<void> TransferOrchestrator::pull_staged(StagingArtifact& artifact, long vmid,
                                               const std::string& container_path, const fs::path& local,
                                               TransferOutcome& outcome) {
    auto pulled = adapter_.copy_out(vmid, container_path, artifact.path());
    if (pulled.is_err()) {
        if (pulled.kind == ErrorKind::IndirectionFailed &&
            pulled.error.find("No such file") != std::string::npos) {
            return Result<void>::Err(ErrorKind::SourceNotFound,
                fmt::format("File not found in container {}: {}", vmid, container_path));
        }
        return pulled;
    }
    advance(outcome, TransferState::Staged);

    auto info = files_.stat(artifact.path());
    if (info.is_err()) {
        // pct pull succeeded, so a missing staging file is an I/O fault
        return Result<void>::Err(ErrorKind::TransferIOError, info.error);
    }
    auto size_ok = check_size(info.value.size, limits_.max_file_size);
    if (size_ok.is_err()) return size_ok;

    auto got = fetch_to_local(artifact.path(), local);
    if (got.is_err()) return Result<void>::from(got);
    outcome.bytes_transferred = got.value;
    advance(outcome, TransferState::Transferred);

    // Local copy takes the mode of the file inside the container
    auto mode = adapter_.file_mode(vmid, container_path);
    if (mode.is_ok()) {
        apply_local_mode(local, mode.value, outcome);
    } else {
        outcome.warnings.push_back("Could not read source mode: " + mode.error);
        relay_log("transfer warning: " + outcome.warnings.back());
    }
    return Result<void>::Ok();
}

Result<void> TransferOrchestrator::push_staged(StagingArtifact& artifact, long vmid, const fs::path& local,
                                               const std::string& container_path, TransferOutcome& outcome) {
    auto put = files_.put(local, artifact.path());
    if (put.is_err()) return Result<void>::from(put);
    advance(outcome, TransferState::Staged);

    auto pushed = adapter_.copy_in(vmid, artifact.path(), container_path);
    if (pushed.is_err()) return pushed;
    outcome.bytes_transferred = put.value;
    advance(outcome, TransferState::Transferred);

    auto chmod = adapter_.set_mode(vmid, container_path, outcome.permissions);
    if (chmod.is_err()) {
        // The file is in place; a failed chmod does not undo that
        outcome.warnings.push_back("File uploaded but setting permissions failed: " + chmod.error);
        relay_log("transfer warning: " + outcome.warnings.back());
    } else {
        outcome.mode = static_cast<unsigned>(std::stoul(outcome.permissions, nullptr, 8));
    }
    return Result<void>::Ok();
}

void TransferOrchestrator::finish_staged(StagingArtifact& artifact, TransferOutcome& outcome) {
    auto warning = artifact.release();
    if (warning) outcome.warnings.push_back(*warning);
    if (outcome.state == TransferState::Transferred) {
        advance(outcome, TransferState::Cleaned);
    }
}

Result<TransferOutcome> TransferOrchestrator::download_from_container(long vmid,
                                                                      const std::string& container_path,
                                                                      const std::string& local_path,
                                                                      bool overwrite) {
    TransferOutcome outcome;
    outcome.direction = TransferDirection::ContainerToLocal;
    outcome.vmid = vmid;
    outcome.source = container_path;
    outcome.destination = local_path;

    auto v = preflight_download(container_path, "container path", local_path, overwrite);
    if (v.is_err()) return failed(outcome, v);
    advance(outcome, TransferState::Validated);

    StagingArtifact artifact(files_, make_staging_path());
    outcome.staging_path = artifact.path();
    auto moved = pull_staged(artifact, vmid, container_path, local_path, outcome);
    finish_staged(artifact, outcome);
    if (moved.is_err()) return failed(outcome, moved);

    log_done(outcome);
    return Result<TransferOutcome>::Ok(outcome);
}

Result<TransferOutcome> TransferOrchestrator::upload_to_container(long vmid, const std::string& local_path,
                                                                  const std::string& container_path,
                                                                  const std::string& permissions,
                                                                  bool overwrite) {
    TransferOutcome outcome;
    outcome.direction = TransferDirection::LocalToContainer;
    outcome.vmid = vmid;
    outcome.source = local_path;
    outcome.destination = container_path;
    outcome.permissions = permissions;

    auto v = preflight_upload(local_path, container_path, "container path", permissions,
                              limits_.max_file_size);
    if (v.is_err()) return failed(outcome, v);

    if (!overwrite) {
        auto exists = adapter_.file_exists(vmid, container_path);
        if (exists.is_err()) return failed(outcome, exists);
        if (exists.value) {
            return failed(outcome, ErrorKind::DestinationExists,
                fmt::format("File already exists in container {}: {} (use overwrite to replace it)",
                            vmid, container_path));
        }
    }
    advance(outcome, TransferState::Validated);

    StagingArtifact artifact(files_, make_staging_path());
    outcome.staging_path = artifact.path();
    auto moved = push_staged(artifact, vmid, local_path, container_path, outcome);
    finish_staged(artifact, outcome);
    if (moved.is_err()) return failed(outcome, moved);

    log_done(outcome);
    return Result<TransferOutcome>::Ok(outcome);
}

// ── Host-direct transfers ──────────────────────────────────

Result<TransferOutcome> TransferOrchestrator::download_from_host(const std::string& host_path,
                                                                 const std::string& local_path,
                                                                 bool overwrite) {
    TransferOutcome outcome;
    outcome.direction = TransferDirection::HostToLocal;
    outcome.source = host_path;
    outcome.destination = local_path;

    auto v = preflight_download(host_path, "host path", local_path, overwrite);
    if (v.is_err()) return failed(outcome, v);
    advance(outcome, TransferState::Validated);

    auto info = files_.stat(host_path);
    if (info.is_err()) return failed(outcome, info);
    if (info.value.has_mode && !info.value.is_regular) {
        return failed(outcome, ErrorKind::PathInvalid, "Host path is not a regular file: " + host_path);
    }
    v = check_size(info.value.size, limits_.max_file_size);
    if (v.is_err()) return failed(outcome, v);

    auto got = fetch_to_local(host_path, local_path);
    if (got.is_err()) return failed(outcome, got);
    outcome.bytes_transferred = got.value;
    advance(outcome, TransferState::Transferred);

    if (info.value.has_mode) {
        apply_local_mode(local_path, info.value.mode, outcome);
    } else {
        outcome.warnings.push_back("Host did not report a mode for " + host_path + "; local mode left as created");
        relay_log("transfer warning: " + outcome.warnings.back());
    }
    advance(outcome, TransferState::Cleaned);

    log_done(outcome);
    return Result<TransferOutcome>::Ok(outcome);
}

Result<TransferOutcome> TransferOrchestrator::upload_to_host(const std::string& local_path,
                                                             const std::string& host_path,
                                                             const std::string& permissions,
                                                             bool overwrite) {
    TransferOutcome outcome;
    outcome.direction = TransferDirection::LocalToHost;
    outcome.source = local_path;
    outcome.destination = host_path;
    outcome.permissions = permissions;

    auto v = preflight_upload(local_path, host_path, "host path", permissions, limits_.max_file_size);
    if (v.is_err()) return failed(outcome, v);

    if (!overwrite) {
        auto exists = host_file_exists(host_path);
        if (exists.is_err()) return failed(outcome, exists);
        if (exists.value) {
            return failed(outcome, ErrorKind::DestinationExists,
                          "File already exists on host: " + host_path + " (use overwrite to replace it)");
        }
    }
    advance(outcome, TransferState::Validated);

    auto put = files_.put(local_path, host_path);
    if (put.is_err()) return failed(outcome, put);
    outcome.bytes_transferred = put.value;
    advance(outcome, TransferState::Transferred);

    auto chmod = require_success(
        shell_.execute(fmt::format("chmod {} {}", shell_quote(permissions), shell_quote(host_path)),
                       SSH_CMD_TIMEOUT_SECS),
        "chmod " + host_path);
    if (chmod.is_err()) {
        outcome.warnings.push_back("File uploaded but setting permissions failed: " + chmod.error);
        relay_log("transfer warning: " + outcome.warnings.back());
    } else {
        outcome.mode = static_cast<unsigned>(std::stoul(permissions, nullptr, 8));
    }
    advance(outcome, TransferState::Cleaned);

    log_done(outcome);
    return Result<TransferOutcome>::Ok(outcome);
}
