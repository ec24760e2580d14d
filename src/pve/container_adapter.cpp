#include "container_adapter.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/shell_quote.hpp>
#include <fmt/format.h>
#include <sstream>

static bool is_vmid(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

ContainerState parse_state_word(const std::string& word) {
    std::string w = to_lower(word);
    if (w == "running") return ContainerState::Running;
    if (w == "stopped") return ContainerState::Stopped;
    return ContainerState::Unknown;
}

std::vector<ContainerInfo> parse_pct_list(const std::string& output) {
    std::vector<ContainerInfo> out;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::istringstream lss(line);
        std::vector<std::string> cols;
        std::string col;
        while (lss >> col) cols.push_back(col);

        // Header ("VMID Status Lock Name") and junk lines
        if (cols.size() < 2 || !is_vmid(cols[0])) continue;

        ContainerInfo info;
        info.vmid = safe_stoll(cols[0], 0);
        info.status = cols[1];
        info.state = parse_state_word(cols[1]);
        if (cols.size() >= 3) info.name = cols.back();
        out.push_back(info);
    }
    return out;
}

ContainerState parse_pct_status(const std::string& output) {
    std::string s = to_lower(output);
    if (s.find("running") != std::string::npos) return ContainerState::Running;
    if (s.find("stopped") != std::string::npos) return ContainerState::Stopped;
    return ContainerState::Unknown;
}

// require_success, then re-label the failure: pct's "does not exist" becomes
// TargetNotFound, any other non-zero exit becomes `failed_kind`.
static Result<CommandResult> check_pct(const Result<CommandResult>& r, const std::string& what,
                                       ErrorKind failed_kind = ErrorKind::CommandFailed) {
    auto checked = require_success(r, what);
    if (checked.is_err() && checked.kind == ErrorKind::CommandFailed) {
        const CommandResult& c = checked.value;
        if (to_lower(c.stderr_data + c.stdout_data).find("does not exist") != std::string::npos) {
            checked.kind = ErrorKind::TargetNotFound;
        } else {
            checked.kind = failed_kind;
        }
    }
    return checked;
}

ContainerAdapter::ContainerAdapter(RemoteShell& shell)
    : shell_(shell) {
}

std::string ContainerAdapter::exec_command(long vmid, const std::string& command) {
    return fmt::format("pct exec {} -- bash -c {}", vmid, shell_quote(command));
}

Result<std::vector<ContainerInfo>> ContainerAdapter::list() {
    auto r = check_pct(shell_.execute("pct list", SSH_CMD_TIMEOUT_SECS), "pct list");
    if (r.is_err()) return Result<std::vector<ContainerInfo>>::Err(r.kind, r.error);
    return Result<std::vector<ContainerInfo>>::Ok(parse_pct_list(r.value.stdout_data));
}

Result<ContainerState> ContainerAdapter::status(long vmid) {
    auto r = check_pct(shell_.execute(fmt::format("pct status {}", vmid), SSH_CMD_TIMEOUT_SECS),
                       fmt::format("pct status {}", vmid));
    if (r.is_err()) return Result<ContainerState>::Err(r.kind, r.error);
    return Result<ContainerState>::Ok(parse_pct_status(r.value.stdout_data));
}

Result<LifecycleChange> ContainerAdapter::transition(long vmid, ContainerState wanted, const char* verb) {
    LifecycleChange change;
    change.vmid = vmid;

    auto before = status(vmid);
    if (before.is_err()) return Result<LifecycleChange>::Err(before.kind, before.error);
    change.previous = before.value;

    if (change.previous == wanted) {
        change.current = wanted;
        return Result<LifecycleChange>::Ok(change);
    }

    std::string cmd = fmt::format("pct {} {}", verb, vmid);
    auto r = check_pct(shell_.execute(cmd, SSH_LIFECYCLE_TIMEOUT_SECS), cmd);
    if (r.is_err()) return Result<LifecycleChange>::Err(r.kind, r.error);
    change.changed = true;

    auto after = status(vmid);
    change.current = after.is_ok() ? after.value : ContainerState::Unknown;
    relay_log(fmt::format("pct: {} {}: {} -> {}", verb, vmid,
                          container_state_name(change.previous), container_state_name(change.current)));
    return Result<LifecycleChange>::Ok(change);
}

Result<LifecycleChange> ContainerAdapter::start(long vmid) {
    return transition(vmid, ContainerState::Running, "start");
}

Result<LifecycleChange> ContainerAdapter::stop(long vmid) {
    return transition(vmid, ContainerState::Stopped, "stop");
}

Result<CommandResult> ContainerAdapter::run(long vmid, const std::string& command, int timeout_secs) {
    return shell_.execute(exec_command(vmid, command), timeout_secs);
}

Result<void> ContainerAdapter::copy_in(long vmid, const std::string& host_path,
                                       const std::string& target_path) {
    std::string cmd = fmt::format("pct push {} {} {}", vmid, shell_quote(host_path), shell_quote(target_path));
    auto r = check_pct(shell_.execute(cmd, SSH_STAGING_TIMEOUT_SECS),
                       fmt::format("Failed to push file into container {}", vmid),
                       ErrorKind::IndirectionFailed);
    return Result<void>::from(r);
}

Result<void> ContainerAdapter::copy_out(long vmid, const std::string& target_path,
                                        const std::string& host_path) {
    std::string cmd = fmt::format("pct pull {} {} {}", vmid, shell_quote(target_path), shell_quote(host_path));
    auto r = check_pct(shell_.execute(cmd, SSH_STAGING_TIMEOUT_SECS),
                       fmt::format("Failed to pull file from container {}", vmid),
                       ErrorKind::IndirectionFailed);
    return Result<void>::from(r);
}

Result<bool> ContainerAdapter::file_exists(long vmid, const std::string& path) {
    std::string cmd = fmt::format("pct exec {} -- test -f {}", vmid, shell_quote(path));
    auto r = shell_.execute(cmd, SSH_CMD_TIMEOUT_SECS);
    if (r.is_err()) return Result<bool>::Err(r.kind, r.error);
    if (r.value.exit_code == 0 && !r.value.timed_out) return Result<bool>::Ok(true);
    if (r.value.exit_code == 1) return Result<bool>::Ok(false);

    // test(1) only exits 0 or 1; anything else came from pct itself
    auto failed = check_pct(r, fmt::format("Cannot check {} in container {}", path, vmid),
                            ErrorKind::IndirectionFailed);
    return Result<bool>::Err(failed.kind, failed.error);
}

Result<void> ContainerAdapter::set_mode(long vmid, const std::string& path, const std::string& perms) {
    std::string cmd = fmt::format("pct exec {} -- chmod {} {}", vmid, shell_quote(perms), shell_quote(path));
    auto r = check_pct(shell_.execute(cmd, SSH_CMD_TIMEOUT_SECS),
                       fmt::format("chmod {} {} in container {}", perms, path, vmid),
                       ErrorKind::IndirectionFailed);
    return Result<void>::from(r);
}

Result<unsigned> ContainerAdapter::file_mode(long vmid, const std::string& path) {
    std::string cmd = fmt::format("pct exec {} -- stat -c %a {}", vmid, shell_quote(path));
    auto r = check_pct(shell_.execute(cmd, SSH_CMD_TIMEOUT_SECS),
                       fmt::format("stat {} in container {}", path, vmid),
                       ErrorKind::IndirectionFailed);
    if (r.is_err()) return Result<unsigned>::Err(r.kind, r.error);

    std::string text = r.value.stdout_data;
    trim(text);
    if (text.empty() || text.size() > 5 || text.find_first_not_of("01234567") != std::string::npos) {
        return Result<unsigned>::Err(ErrorKind::IndirectionFailed,
                                     fmt::format("Unexpected mode '{}' for {}", text, path));
    }
    return Result<unsigned>::Ok(static_cast<unsigned>(std::stoul(text, nullptr, 8)));
}
