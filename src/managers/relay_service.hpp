#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <core/config.hpp>
#include <ssh/session.hpp>
#include <ssh/command_executor.hpp>
#include <ssh/sftp_channel.hpp>
#include <pve/container_adapter.hpp>
#include <transfer/transfer_orchestrator.hpp>

// What one named operation produced. Exactly one of the payload fields is
// filled on success; on failure `kind` and `message` say why, and the
// payload may still carry partial data (captured streams, transfer state).
struct OperationResult {
    bool success = false;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string suggestion;

    std::optional<CommandResult> command;
    std::optional<TransferOutcome> transfer;
    std::optional<LifecycleChange> lifecycle;
    std::optional<ContainerState> state;
    std::vector<ContainerInfo> containers;
    std::vector<std::string> warnings;
};

// A short hint for the user, keyed on the failure kind. Empty if none applies.
std::string suggestion_for(ErrorKind kind);

// Headless facade over the one host connection. Owns the session and every
// component built on it; any frontend drives the host through this class.
// Operations are serialized: one holds the session at a time.
class RelayService {
public:
    // `config` must already have passed Config::validate().
    explicit RelayService(const Config& config);
    ~RelayService();

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    // ── Connection lifecycle ──────────────────────────────────

    Result<void> connect(StatusCallback cb = nullptr);
    void disconnect();

    // Drop whatever is left of the session and connect again.
    Result<void> reconnect(StatusCallback cb = nullptr);

    bool is_connected() const;
    bool check_alive();

    // ── Containers ────────────────────────────────────────────

    OperationResult list_containers();
    OperationResult container_status(long vmid);
    OperationResult start_container(long vmid);
    OperationResult stop_container(long vmid);
    OperationResult container_exec(long vmid, const std::string& command, int timeout_secs);

    // ── Host (require enable_host_exec) ───────────────────────

    OperationResult host_exec(const std::string& command, int timeout_secs);

    // ── Transfers ─────────────────────────────────────────────

    OperationResult download_from_container(long vmid, const std::string& container_path,
                                            const std::string& local_path, bool overwrite);
    OperationResult upload_to_container(long vmid, const std::string& local_path,
                                        const std::string& container_path,
                                        const std::string& permissions, bool overwrite);
    OperationResult download_from_host(const std::string& host_path, const std::string& local_path,
                                       bool overwrite);
    OperationResult upload_to_host(const std::string& local_path, const std::string& host_path,
                                   const std::string& permissions, bool overwrite);

    const Config& config() const { return config_; }
    const std::string& target() const { return session_->get_target(); }

private:
    const Config config_;
    mutable std::mutex mutex_;

    std::unique_ptr<SessionManager> session_;
    std::unique_ptr<CommandExecutor> executor_;
    std::unique_ptr<SftpChannel> files_;
    std::unique_ptr<ContainerAdapter> adapter_;
    std::unique_ptr<TransferOrchestrator> transfers_;

    OperationResult host_disabled() const;
    OperationResult run_command(const Result<CommandResult>& r, const std::string& what);
    OperationResult from_transfer(const Result<TransferOutcome>& r);
};
