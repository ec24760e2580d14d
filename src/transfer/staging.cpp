#include "staging.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Init:        return "INIT";
        case TransferState::Validated:   return "VALIDATED";
        case TransferState::Staged:      return "STAGED";
        case TransferState::Transferred: return "TRANSFERRED";
        case TransferState::Cleaned:     return "CLEANED";
        case TransferState::Failed:      return "FAILED";
    }
    return "UNKNOWN";
}

const char* transfer_direction_name(TransferDirection dir) {
    switch (dir) {
        case TransferDirection::ContainerToLocal: return "container-to-local";
        case TransferDirection::LocalToContainer: return "local-to-container";
        case TransferDirection::HostToLocal:      return "host-to-local";
        case TransferDirection::LocalToHost:      return "local-to-host";
    }
    return "unknown";
}

bool is_terminal(TransferState state) {
    return state == TransferState::Cleaned || state == TransferState::Failed;
}

bool is_legal_transition(TransferState from, TransferState to) {
    if (is_terminal(from)) return false;
    if (to == TransferState::Failed) return true;

    switch (from) {
        case TransferState::Init:
            return to == TransferState::Validated;
        case TransferState::Validated:
            return to == TransferState::Staged || to == TransferState::Transferred;
        case TransferState::Staged:
            return to == TransferState::Transferred;
        case TransferState::Transferred:
            return to == TransferState::Cleaned;
        default:
            return false;
    }
}

void advance(TransferOutcome& outcome, TransferState next) {
    if (!is_legal_transition(outcome.state, next)) {
        relay_log(fmt::format("transfer: illegal transition {} -> {} ({} -> {})",
                              transfer_state_name(outcome.state), transfer_state_name(next),
                              outcome.source, outcome.destination));
        mark_failed(outcome);
        return;
    }
    outcome.state = next;
}

void mark_failed(TransferOutcome& outcome) {
    if (!is_terminal(outcome.state)) {
        outcome.state = TransferState::Failed;
    }
}

StagingArtifact::StagingArtifact(FileChannel& files, std::string path)
    : files_(files), path_(std::move(path)) {
}

StagingArtifact::~StagingArtifact() {
    auto warning = release();
    (void)warning;  // already logged by release()
}

std::optional<std::string> StagingArtifact::release() {
    if (released_) return std::nullopt;
    released_ = true;

    auto r = files_.remove(path_);
    if (r.is_err()) {
        std::string warning = fmt::format("Failed to remove staging file {}: {}", path_, r.error);
        relay_log("cleanup warning: " + warning);
        return warning;
    }
    relay_log("cleanup: removed " + path_);
    return std::nullopt;
}
