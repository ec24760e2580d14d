#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <ssh/file_channel.hpp>

// Per-transfer state machine:
//   Init -> Validated -> Staged -> Transferred -> Cleaned
// Host-direct transfers go Validated -> Transferred (nothing is staged).
// Failed is reachable from every non-terminal state.
enum class TransferState {
    Init,
    Validated,
    Staged,
    Transferred,
    Cleaned,
    Failed,
};

enum class TransferDirection {
    ContainerToLocal,
    LocalToContainer,
    HostToLocal,
    LocalToHost,
};

const char* transfer_state_name(TransferState state);
const char* transfer_direction_name(TransferDirection dir);

bool is_terminal(TransferState state);
bool is_legal_transition(TransferState from, TransferState to);

struct TransferOutcome {
    TransferDirection direction = TransferDirection::ContainerToLocal;
    long vmid = 0;                  // 0 for host-direct transfers
    std::string source;
    std::string destination;
    int64_t bytes_transferred = 0;
    TransferState state = TransferState::Init;
    std::string permissions;        // requested on upload
    std::optional<unsigned> mode;   // mode bits of the destination, when known
    std::string staging_path;       // empty for host-direct transfers
    std::vector<std::string> warnings;
};

// Move the outcome to `next`. An illegal move is logged and marks the
// transfer Failed.
void advance(TransferOutcome& outcome, TransferState next);

// Failed, unless already terminal.
void mark_failed(TransferOutcome& outcome);

// One host-side staging file, removed over the FileChannel when released.
// release() is idempotent and runs from the destructor if the owner never
// called it, so the file cannot outlive the transfer that created it.
class StagingArtifact {
public:
    StagingArtifact(FileChannel& files, std::string path);
    ~StagingArtifact();

    StagingArtifact(const StagingArtifact&) = delete;
    StagingArtifact& operator=(const StagingArtifact&) = delete;

    const std::string& path() const { return path_; }
    bool released() const { return released_; }

    // Remove the file. Returns a warning if removal failed; never escalates.
    std::optional<std::string> release();

private:
    FileChannel& files_;
    std::string path_;
    bool released_ = false;
};
