#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_shell.hpp>

// Parse `pct list` output. The header and any line whose first column is not
// a vmid are skipped; columns may be separated by any run of whitespace.
// The name is the last column (the optional Lock column sits between).
std::vector<ContainerInfo> parse_pct_list(const std::string& output);

// Classify `pct status` output. Anything unrecognised is Unknown.
ContainerState parse_pct_status(const std::string& output);

ContainerState parse_state_word(const std::string& word);

// Drives containers through the host's `pct` command. Every logical operation
// is one shell command sent through the RemoteShell; container state is never
// cached.
class ContainerAdapter {
public:
    explicit ContainerAdapter(RemoteShell& shell);

    Result<std::vector<ContainerInfo>> list();

    // TargetNotFound if pct reports no such container.
    Result<ContainerState> status(long vmid);

    // Idempotent: starting a running container (or stopping a stopped one)
    // succeeds with changed = false and sends no lifecycle command.
    Result<LifecycleChange> start(long vmid);
    Result<LifecycleChange> stop(long vmid);

    // Run `command` under bash inside the container. Same contract as
    // RemoteShell::execute: a non-zero exit is still Ok.
    Result<CommandResult> run(long vmid, const std::string& command, int timeout_secs);

    // Staging primitives. IndirectionFailed on a non-zero exit.
    Result<void> copy_in(long vmid, const std::string& host_path, const std::string& target_path);
    Result<void> copy_out(long vmid, const std::string& target_path, const std::string& host_path);

    Result<bool> file_exists(long vmid, const std::string& path);
    Result<void> set_mode(long vmid, const std::string& path, const std::string& perms);
    Result<unsigned> file_mode(long vmid, const std::string& path);

    // `pct exec <vmid> -- bash -c '<command>'`
    static std::string exec_command(long vmid, const std::string& command);

private:
    RemoteShell& shell_;

    Result<LifecycleChange> transition(long vmid, ContainerState wanted, const char* verb);
};
