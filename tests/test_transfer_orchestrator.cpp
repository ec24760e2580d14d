#include <gtest/gtest.h>
#include <transfer/transfer_orchestrator.hpp>
#include "fake_host.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

namespace fs = std::filesystem;

class TransferTest : public ::testing::Test {
protected:
    fs::path tmp_dir;
    FakeHost host;
    TransferLimits limits;
    std::unique_ptr<ContainerAdapter> adapter;
    std::unique_ptr<TransferOrchestrator> transfers;

    void SetUp() override {
        std::random_device rd;
        tmp_dir = fs::temp_directory_path() / ("pxrelay_transfer_test_" + std::to_string(rd()));
        fs::create_directories(tmp_dir);

        host.add_container(101, "web", ContainerState::Running);
        limits.max_file_size = 10 * 1024 * 1024;
        limits.staging_prefix = "/tmp/pxrelay-";
        rebuild();
    }

    void TearDown() override {
        fs::remove_all(tmp_dir);
    }

    void rebuild() {
        adapter = std::make_unique<ContainerAdapter>(host);
        transfers = std::make_unique<TransferOrchestrator>(host, host, *adapter, limits);
    }

    std::string write_local(const std::string& name, const std::string& content) {
        fs::path p = tmp_dir / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    static std::string read_local(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    static unsigned local_mode(const std::string& path) {
        return static_cast<unsigned>(fs::status(path).permissions()) & 07777;
    }

    size_t staging_files() const { return host.files_with_prefix(limits.staging_prefix); }
};

// ── Container round trip ───────────────────────────────────

TEST_F(TransferTest, UploadThenDownloadPreservesBytesAndMode) {
    static const char raw[] = "binary\0data\n\xff\x01 with 'quotes'";
    std::string payload(raw, sizeof(raw) - 1);
    std::string src = write_local("src.bin", payload);

    auto up = transfers->upload_to_container(101, src, "/root/my file.bin", "640", false);
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_EQ(up.value.state, TransferState::Cleaned);
    EXPECT_EQ(up.value.bytes_transferred, static_cast<int64_t>(payload.size()));
    ASSERT_TRUE(up.value.mode.has_value());
    EXPECT_EQ(*up.value.mode, 0640u);
    EXPECT_TRUE(up.value.warnings.empty());
    EXPECT_EQ(host.containers[101].files["/root/my file.bin"].data, payload);
    EXPECT_EQ(staging_files(), 0u);

    std::string dst = (tmp_dir / "back.bin").string();
    auto down = transfers->download_from_container(101, "/root/my file.bin", dst, false);
    ASSERT_TRUE(down.is_ok()) << down.error;
    EXPECT_EQ(down.value.state, TransferState::Cleaned);
    EXPECT_EQ(read_local(dst), payload);
    EXPECT_EQ(local_mode(dst), 0640u);
    EXPECT_EQ(staging_files(), 0u);
}

TEST_F(TransferTest, StagingPathUsesPrefixAndToken) {
    std::string p = transfers->make_staging_path();
    EXPECT_EQ(p.rfind("/tmp/pxrelay-", 0), 0u);
    EXPECT_EQ(p.size(), std::string("/tmp/pxrelay-").size() + 32);
    EXPECT_NE(p, transfers->make_staging_path());
}

TEST_F(TransferTest, DownloadOverwritesOnlyWhenAsked) {
    host.containers[101].files["/etc/motd"] = FakeFile{"new", 0644};
    std::string dst = write_local("motd", "old");

    auto refused = transfers->download_from_container(101, "/etc/motd", dst, false);
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.kind, ErrorKind::DestinationExists);
    EXPECT_EQ(read_local(dst), "old");

    auto replaced = transfers->download_from_container(101, "/etc/motd", dst, true);
    ASSERT_TRUE(replaced.is_ok()) << replaced.error;
    EXPECT_EQ(read_local(dst), "new");
}

// ── Validation before transport ────────────────────────────

TEST_F(TransferTest, OversizedUploadRejectedBeforeAnyTransport) {
    std::string src = write_local("big.bin", std::string(15 * 1024 * 1024, 'x'));

    auto r = transfers->upload_to_container(101, src, "/root/big.bin", "644", false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SizeExceedsLimit);
    EXPECT_EQ(r.value.state, TransferState::Failed);
    EXPECT_EQ(host.transport_calls(), 0u);
}

TEST_F(TransferTest, ExistingLocalDestinationRejectedBeforeStaging) {
    host.containers[101].files["/root/a"] = FakeFile{"a", 0644};
    std::string dst = write_local("a", "local");

    auto r = transfers->download_from_container(101, "/root/a", dst, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DestinationExists);
    EXPECT_EQ(host.transport_calls(), 0u);
    EXPECT_TRUE(r.value.staging_path.empty());
}

TEST_F(TransferTest, TraversalRejectedOnEveryDirection) {
    std::string src = write_local("ok.txt", "x");
    std::string dst = (tmp_dir / "out.txt").string();

    auto a = transfers->download_from_container(101, "/root/../etc/shadow", dst, false);
    auto b = transfers->upload_to_container(101, src, "/root/../../etc/cron.d/x", "644", false);
    auto c = transfers->download_from_host("/etc/../etc/shadow", dst, false);
    auto d = transfers->upload_to_host(src, "/root/../tmp/x", "644", false);

    for (const auto* r : {&a, &b, &c, &d}) {
        ASSERT_TRUE(r->is_err());
        EXPECT_EQ(r->kind, ErrorKind::PathInvalid);
        EXPECT_NE(r->error.find(".."), std::string::npos);
    }
    EXPECT_EQ(host.transport_calls(), 0u);
}

TEST_F(TransferTest, BadPermissionsRejectedBeforeTransport) {
    std::string src = write_local("ok.txt", "x");
    auto r = transfers->upload_to_container(101, src, "/root/ok.txt", "999", false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PermissionInvalid);
    EXPECT_EQ(host.transport_calls(), 0u);
}

TEST_F(TransferTest, MissingLocalSource) {
    auto r = transfers->upload_to_container(101, (tmp_dir / "nope").string(), "/root/x", "644", true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SourceNotFound);
    EXPECT_EQ(host.transport_calls(), 0u);
}

TEST_F(TransferTest, ExistingContainerFileRejectedWithoutStaging) {
    host.containers[101].files["/root/x"] = FakeFile{"keep", 0644};
    std::string src = write_local("x", "replace");

    auto r = transfers->upload_to_container(101, src, "/root/x", "644", false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DestinationExists);
    EXPECT_EQ(host.sftp_calls, 0);
    EXPECT_FALSE(host.ran("pct push"));
    EXPECT_EQ(host.containers[101].files["/root/x"].data, "keep");
}

// ── Staging cleanup on every exit path ─────────────────────

TEST_F(TransferTest, MissingContainerSourceIsSourceNotFound) {
    auto r = transfers->download_from_container(101, "/root/absent", (tmp_dir / "o").string(), false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SourceNotFound);
    EXPECT_EQ(staging_files(), 0u);
    EXPECT_FALSE(fs::exists(tmp_dir / "o"));
}

TEST_F(TransferTest, OversizedContainerFileCleanedUp) {
    limits.max_file_size = 1000;
    rebuild();
    host.containers[101].files["/var/log/big"] = FakeFile{std::string(2000, 'z'), 0644};

    auto r = transfers->download_from_container(101, "/var/log/big", (tmp_dir / "big").string(), false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SizeExceedsLimit);
    EXPECT_EQ(r.value.state, TransferState::Failed);
    EXPECT_FALSE(r.value.staging_path.empty());
    EXPECT_EQ(staging_files(), 0u);
    EXPECT_FALSE(fs::exists(tmp_dir / "big"));
}

TEST_F(TransferTest, FailedFetchLeavesNoStagingOrPartialFile) {
    host.containers[101].files["/root/f"] = FakeFile{"abc", 0644};
    host.fail_get = true;

    auto r = transfers->download_from_container(101, "/root/f", (tmp_dir / "f").string(), false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TransferIOError);
    EXPECT_EQ(staging_files(), 0u);
    EXPECT_TRUE(fs::is_empty(tmp_dir));
}

TEST_F(TransferTest, FailedPushRemovesStagingFile) {
    std::string src = write_local("s", "payload");
    // No container 999: pct push fails after the file was staged
    auto r = transfers->upload_to_container(999, src, "/root/s", "644", true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TargetNotFound);
    EXPECT_EQ(r.value.state, TransferState::Failed);
    EXPECT_TRUE(host.ran("pct push 999"));
    EXPECT_EQ(staging_files(), 0u);
}

TEST_F(TransferTest, CleanupFailureIsOnlyAWarning) {
    host.containers[101].files["/root/f"] = FakeFile{"abc", 0600};
    host.fail_remove = true;

    auto r = transfers->download_from_container(101, "/root/f", (tmp_dir / "f").string(), false);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.state, TransferState::Cleaned);
    ASSERT_EQ(r.value.warnings.size(), 1u);
    EXPECT_NE(r.value.warnings[0].find(r.value.staging_path), std::string::npos);
    EXPECT_EQ(read_local((tmp_dir / "f").string()), "abc");
}

TEST_F(TransferTest, ChmodFailureAfterPushIsAWarning) {
    std::string src = write_local("s", "payload");
    // A stopped container accepts pct push in the fake but not pct exec
    host.add_container(102, "idle", ContainerState::Stopped);

    auto r = transfers->upload_to_container(102, src, "/root/s", "600", true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.state, TransferState::Cleaned);
    EXPECT_FALSE(r.value.mode.has_value());
    ASSERT_EQ(r.value.warnings.size(), 1u);
    EXPECT_EQ(host.containers[102].files["/root/s"].data, "payload");
}

TEST_F(TransferTest, NotConnectedFailsWithoutStagingLeftovers) {
    std::string src = write_local("s", "payload");
    host.connected = false;

    auto r = transfers->upload_to_container(101, src, "/root/s", "644", true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
    EXPECT_EQ(staging_files(), 0u);
}

// ── Host-direct transfers ──────────────────────────────────

TEST_F(TransferTest, HostRoundTripStagesNothing) {
    std::string src = write_local("h", "host bytes");

    auto up = transfers->upload_to_host(src, "/srv/h", "0600", false);
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_TRUE(up.value.staging_path.empty());
    EXPECT_EQ(up.value.state, TransferState::Cleaned);
    EXPECT_EQ(host.host_files["/srv/h"].data, "host bytes");
    EXPECT_EQ(host.host_files["/srv/h"].mode, 0600u);
    EXPECT_FALSE(host.ran("pct"));

    std::string dst = (tmp_dir / "h2").string();
    auto down = transfers->download_from_host("/srv/h", dst, false);
    ASSERT_TRUE(down.is_ok()) << down.error;
    EXPECT_EQ(read_local(dst), "host bytes");
    EXPECT_EQ(local_mode(dst), 0600u);
    EXPECT_EQ(host.host_files.size(), 1u);
}

TEST_F(TransferTest, HostUploadRefusesExistingFile) {
    host.host_files["/srv/h"] = FakeFile{"keep", 0644};
    std::string src = write_local("h", "new");

    auto r = transfers->upload_to_host(src, "/srv/h", "644", false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DestinationExists);
    EXPECT_EQ(host.sftp_calls, 0);
    EXPECT_EQ(host.host_files["/srv/h"].data, "keep");
}

TEST_F(TransferTest, HostDownloadOfMissingFile) {
    auto r = transfers->download_from_host("/srv/absent", (tmp_dir / "x").string(), false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SourceNotFound);
    EXPECT_FALSE(fs::exists(tmp_dir / "x"));
}

TEST_F(TransferTest, HostDownloadOverCeiling) {
    limits.max_file_size = 10;
    rebuild();
    host.host_files["/srv/big"] = FakeFile{std::string(11, 'b'), 0644};

    auto r = transfers->download_from_host("/srv/big", (tmp_dir / "big").string(), false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SizeExceedsLimit);
    EXPECT_FALSE(fs::exists(tmp_dir / "big"));
}

TEST_F(TransferTest, HostDownloadWithoutReportedModeKeepsLocalDefault) {
    host.host_files["/etc/motd"] = FakeFile{"hello", 0, false};

    std::string dst = (tmp_dir / "motd").string();
    auto r = transfers->download_from_host("/etc/motd", dst, false);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.state, TransferState::Cleaned);
    EXPECT_EQ(read_local(dst), "hello");
    EXPECT_NE(local_mode(dst) & 0400u, 0u);
    EXPECT_FALSE(r.value.mode.has_value());
    ASSERT_EQ(r.value.warnings.size(), 1u);
    EXPECT_NE(r.value.warnings[0].find("/etc/motd"), std::string::npos);
}

// ── Local pre-flight ───────────────────────────────────────

TEST_F(TransferTest, PreflightNeedsNoHost) {
    std::string src = write_local("ok", "12345");
    EXPECT_TRUE(TransferOrchestrator::preflight_upload(src, "/root/ok", "container path", "644", 5).is_ok());
    EXPECT_EQ(TransferOrchestrator::preflight_upload(src, "/root/ok", "container path", "644", 4).kind,
              ErrorKind::SizeExceedsLimit);
    EXPECT_EQ(TransferOrchestrator::preflight_upload(src, "/root/ok", "host path", "999", 5).kind,
              ErrorKind::PermissionInvalid);
    EXPECT_EQ(TransferOrchestrator::preflight_upload((tmp_dir / "none").string(), "/root/ok",
                                                     "host path", "644", 5).kind,
              ErrorKind::SourceNotFound);

    EXPECT_TRUE(TransferOrchestrator::preflight_download("/etc/hosts", "host path",
                                                         (tmp_dir / "new").string(), false).is_ok());
    EXPECT_EQ(TransferOrchestrator::preflight_download("/etc/hosts", "host path", src, false).kind,
              ErrorKind::DestinationExists);
    EXPECT_TRUE(TransferOrchestrator::preflight_download("/etc/hosts", "host path", src, true).is_ok());
    EXPECT_EQ(TransferOrchestrator::preflight_download("/etc/../shadow", "host path",
                                                       (tmp_dir / "new").string(), false).kind,
              ErrorKind::PathInvalid);

    EXPECT_EQ(host.transport_calls(), 0u);
}
