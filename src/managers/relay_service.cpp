#include "relay_service.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

std::string suggestion_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotConnected:
            return "Run 'reconnect' to open a new session";
        case ErrorKind::ConnectionError:
            return "Check that the host is reachable and the credentials are right, then run 'reconnect'";
        case ErrorKind::TransferIOError:
            return "The session may have dropped; run 'reconnect' and retry";
        case ErrorKind::DestinationExists:
            return "Set overwrite to replace the existing file or choose a different path";
        case ErrorKind::SizeExceedsLimit:
            return "Increase MAX_FILE_SIZE or choose a smaller file";
        case ErrorKind::SourceNotFound:
            return "Check that the source path is correct and the file exists";
        case ErrorKind::TargetNotFound:
            return "Check the container id with 'list'";
        case ErrorKind::IndirectionFailed:
            return "Check that the container exists, is running, and the path is valid";
        case ErrorKind::HostAccessDisabled:
            return "Set ENABLE_HOST_EXEC=true (or enable_host_exec: true) to allow host operations";
        case ErrorKind::CommandTimeout:
            return "Raise the timeout or run long jobs in the background";
        default:
            return "";
    }
}

template <typename T>
static OperationResult failure(const Result<T>& r) {
    OperationResult out;
    out.kind = r.kind;
    out.message = r.error;
    out.suggestion = suggestion_for(r.kind);
    return out;
}

RelayService::RelayService(const Config& config)
    : config_(config) {
    session_ = std::make_unique<SessionManager>(config_.host());
    executor_ = std::make_unique<CommandExecutor>(*session_);
    files_ = std::make_unique<SftpChannel>(*session_);
    adapter_ = std::make_unique<ContainerAdapter>(*executor_);
    transfers_ = std::make_unique<TransferOrchestrator>(*executor_, *files_, *adapter_,
                                                        config_.transfer());
}

RelayService::~RelayService() {
    disconnect();
}

// ── Connection lifecycle ──────────────────────────────────────

Result<void> RelayService::connect(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_->is_active()) return Result<void>::Ok();
    return session_->establish(cb);
}

void RelayService::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_->close();
}

Result<void> RelayService::reconnect(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    relay_log("service: reconnect requested");
    session_->close();
    return session_->establish(cb);
}

bool RelayService::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_->is_active();
}

bool RelayService::check_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_->check_alive();
}

// ── Helpers ───────────────────────────────────────────────────

OperationResult RelayService::host_disabled() const {
    OperationResult out;
    out.kind = ErrorKind::HostAccessDisabled;
    out.message = "Host operations are disabled";
    out.suggestion = suggestion_for(out.kind);
    return out;
}

OperationResult RelayService::run_command(const Result<CommandResult>& r, const std::string& what) {
    if (r.is_err()) return failure(r);

    OperationResult out;
    out.command = r.value;
    auto checked = require_success(r, what);
    if (checked.is_err()) {
        out.kind = checked.kind;
        out.message = checked.error;
        out.suggestion = suggestion_for(checked.kind);
        return out;
    }
    out.success = true;
    return out;
}

OperationResult RelayService::from_transfer(const Result<TransferOutcome>& r) {
    OperationResult out = r.is_ok() ? OperationResult{} : failure(r);
    out.success = r.is_ok();
    out.transfer = r.value;
    out.warnings = r.value.warnings;
    return out;
}

// ── Containers ────────────────────────────────────────────────

OperationResult RelayService::list_containers() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = adapter_->list();
    if (r.is_err()) return failure(r);

    OperationResult out;
    out.success = true;
    out.containers = r.value;
    out.message = fmt::format("{} container(s)", r.value.size());
    return out;
}

OperationResult RelayService::container_status(long vmid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = adapter_->status(vmid);
    if (r.is_err()) return failure(r);

    OperationResult out;
    out.success = true;
    out.state = r.value;
    out.message = fmt::format("Container {} is {}", vmid, container_state_name(r.value));
    return out;
}

OperationResult RelayService::start_container(long vmid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = adapter_->start(vmid);
    if (r.is_err()) return failure(r);

    OperationResult out;
    out.success = true;
    out.lifecycle = r.value;
    out.message = r.value.changed ? fmt::format("Container {} started", vmid)
                                  : fmt::format("Container {} is already running", vmid);
    return out;
}

OperationResult RelayService::stop_container(long vmid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = adapter_->stop(vmid);
    if (r.is_err()) return failure(r);

    OperationResult out;
    out.success = true;
    out.lifecycle = r.value;
    out.message = r.value.changed ? fmt::format("Container {} stopped", vmid)
                                  : fmt::format("Container {} is already stopped", vmid);
    return out;
}

OperationResult RelayService::container_exec(long vmid, const std::string& command, int timeout_secs) {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_command(adapter_->run(vmid, command, timeout_secs),
                       fmt::format("Command in container {}", vmid));
}

// ── Host ──────────────────────────────────────────────────────

OperationResult RelayService::host_exec(const std::string& command, int timeout_secs) {
    if (!config_.enable_host_exec()) return host_disabled();
    std::lock_guard<std::mutex> lock(mutex_);
    return run_command(executor_->execute(command, timeout_secs), "Host command");
}

// ── Transfers ─────────────────────────────────────────────────

OperationResult RelayService::download_from_container(long vmid, const std::string& container_path,
                                                      const std::string& local_path, bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = from_transfer(transfers_->download_from_container(vmid, container_path, local_path, overwrite));
    if (out.success) out.message = fmt::format("File downloaded successfully from container {}", vmid);
    return out;
}

OperationResult RelayService::upload_to_container(long vmid, const std::string& local_path,
                                                  const std::string& container_path,
                                                  const std::string& permissions, bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = from_transfer(
        transfers_->upload_to_container(vmid, local_path, container_path, permissions, overwrite));
    if (out.success) out.message = fmt::format("File uploaded successfully to container {}", vmid);
    return out;
}

OperationResult RelayService::download_from_host(const std::string& host_path, const std::string& local_path,
                                                 bool overwrite) {
    if (!config_.enable_host_exec()) return host_disabled();
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = from_transfer(transfers_->download_from_host(host_path, local_path, overwrite));
    if (out.success) out.message = "File downloaded successfully from host";
    return out;
}

OperationResult RelayService::upload_to_host(const std::string& local_path, const std::string& host_path,
                                             const std::string& permissions, bool overwrite) {
    if (!config_.enable_host_exec()) return host_disabled();
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = from_transfer(transfers_->upload_to_host(local_path, host_path, permissions, overwrite));
    if (out.success) out.message = "File uploaded successfully to host";
    return out;
}
