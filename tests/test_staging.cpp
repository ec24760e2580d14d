#include <gtest/gtest.h>
#include <transfer/staging.hpp>
#include "fake_host.hpp"

TEST(TransferState, HappyPathsAreLegal) {
    EXPECT_TRUE(is_legal_transition(TransferState::Init, TransferState::Validated));
    EXPECT_TRUE(is_legal_transition(TransferState::Validated, TransferState::Staged));
    EXPECT_TRUE(is_legal_transition(TransferState::Staged, TransferState::Transferred));
    EXPECT_TRUE(is_legal_transition(TransferState::Transferred, TransferState::Cleaned));
    // host-direct
    EXPECT_TRUE(is_legal_transition(TransferState::Validated, TransferState::Transferred));
}

TEST(TransferState, FailedFromAnyNonTerminal) {
    for (auto s : {TransferState::Init, TransferState::Validated, TransferState::Staged,
                   TransferState::Transferred}) {
        EXPECT_TRUE(is_legal_transition(s, TransferState::Failed)) << transfer_state_name(s);
    }
}

TEST(TransferState, TerminalStatesAreFinal) {
    EXPECT_FALSE(is_legal_transition(TransferState::Cleaned, TransferState::Failed));
    EXPECT_FALSE(is_legal_transition(TransferState::Failed, TransferState::Validated));
    EXPECT_TRUE(is_terminal(TransferState::Cleaned));
    EXPECT_TRUE(is_terminal(TransferState::Failed));
}

TEST(TransferState, NoSkippingOrGoingBack) {
    EXPECT_FALSE(is_legal_transition(TransferState::Init, TransferState::Staged));
    EXPECT_FALSE(is_legal_transition(TransferState::Staged, TransferState::Cleaned));
    EXPECT_FALSE(is_legal_transition(TransferState::Transferred, TransferState::Staged));
}

TEST(TransferState, IllegalAdvanceMarksFailed) {
    TransferOutcome o;
    advance(o, TransferState::Transferred);
    EXPECT_EQ(o.state, TransferState::Failed);

    // Terminal stays terminal
    advance(o, TransferState::Validated);
    EXPECT_EQ(o.state, TransferState::Failed);
}

TEST(TransferState, MarkFailedKeepsCleaned) {
    TransferOutcome o;
    o.state = TransferState::Cleaned;
    mark_failed(o);
    EXPECT_EQ(o.state, TransferState::Cleaned);
}

TEST(StagingArtifact, ReleaseTwiceIsHarmless) {
    FakeHost host;
    host.host_files["/tmp/pxrelay-abc"] = FakeFile{"data", 0600};

    StagingArtifact artifact(host, "/tmp/pxrelay-abc");
    EXPECT_FALSE(artifact.release().has_value());
    EXPECT_TRUE(artifact.released());
    EXPECT_EQ(host.host_files.count("/tmp/pxrelay-abc"), 0u);

    int calls = host.sftp_calls;
    EXPECT_FALSE(artifact.release().has_value());
    EXPECT_EQ(host.sftp_calls, calls);
}

TEST(StagingArtifact, DestructorRemovesFile) {
    FakeHost host;
    host.host_files["/tmp/pxrelay-def"] = FakeFile{"data", 0600};
    {
        StagingArtifact artifact(host, "/tmp/pxrelay-def");
    }
    EXPECT_EQ(host.host_files.count("/tmp/pxrelay-def"), 0u);
}

TEST(StagingArtifact, RemovalFailureIsAWarning) {
    FakeHost host;
    host.fail_remove = true;
    StagingArtifact artifact(host, "/tmp/pxrelay-xyz");
    auto warning = artifact.release();
    ASSERT_TRUE(warning.has_value());
    EXPECT_NE(warning->find("/tmp/pxrelay-xyz"), std::string::npos);
    EXPECT_TRUE(artifact.released());
}
