#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <ssh/remote_shell.hpp>
#include <ssh/file_channel.hpp>
#include <pve/container_adapter.hpp>
#include "staging.hpp"

// Moves files between the local filesystem, the host and containers.
//
// Container transfers are staged through a host file named
// <staging_prefix><32 hex chars>: pulled out of the container with `pct pull`
// then fetched over SFTP, or sent over SFTP then pushed in with `pct push`.
// The staging file is removed on every exit path. Host transfers talk to the
// real host path directly and stage nothing.
//
// Validation (paths, permissions, local size and overwrite guards) runs
// before anything is sent to the host. On failure the returned Result still
// carries the outcome so callers can report the state reached and any
// cleanup warnings.
class TransferOrchestrator {
public:
    TransferOrchestrator(RemoteShell& shell, FileChannel& files, ContainerAdapter& adapter,
                         const TransferLimits& limits);

    Result<TransferOutcome> download_from_container(long vmid, const std::string& container_path,
                                                    const std::string& local_path, bool overwrite);

    Result<TransferOutcome> upload_to_container(long vmid, const std::string& local_path,
                                                const std::string& container_path,
                                                const std::string& permissions, bool overwrite);

    Result<TransferOutcome> download_from_host(const std::string& host_path,
                                               const std::string& local_path, bool overwrite);

    Result<TransferOutcome> upload_to_host(const std::string& local_path, const std::string& host_path,
                                           const std::string& permissions, bool overwrite);

    // Fresh host path for one staged transfer.
    std::string make_staging_path() const;

    // Checks that need only the arguments and the local filesystem. Every
    // transfer runs them first; a frontend may run them before connecting.
    // `remote_label` names the far end in messages ("container path", "host path").
    static Result<void> preflight_download(const std::string& remote_path, const std::string& remote_label,
                                           const std::string& local_path, bool overwrite);
    static Result<void> preflight_upload(const std::string& local_path, const std::string& remote_path,
                                         const std::string& remote_label, const std::string& permissions,
                                         int64_t max_file_size);

private:
    RemoteShell& shell_;
    FileChannel& files_;
    ContainerAdapter& adapter_;
    TransferLimits limits_;

    static Result<void> check_local_destination(const std::filesystem::path& local, bool overwrite);
    static Result<int64_t> check_local_source(const std::filesystem::path& local);
    Result<bool> host_file_exists(const std::string& path);

    // SFTP get into a sibling temp file, then rename over `local`. An
    // existing file is only replaced once all bytes have arrived.
    Result<int64_t> fetch_to_local(const std::string& remote, const std::filesystem::path& local);

    void apply_local_mode(const std::filesystem::path& local, unsigned mode, TransferOutcome& outcome);

    Result<void> pull_staged(StagingArtifact& artifact, long vmid, const std::string& container_path,
                             const std::filesystem::path& local, TransferOutcome& outcome);
    Result<void> push_staged(StagingArtifact& artifact, long vmid, const std::filesystem::path& local,
                             const std::string& container_path, TransferOutcome& outcome);

    // Release the artifact and settle the final state. Runs unconditionally.
    void finish_staged(StagingArtifact& artifact, TransferOutcome& outcome);
};
