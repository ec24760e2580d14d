#include <gtest/gtest.h>
#include <pve/container_adapter.hpp>
#include "fake_host.hpp"

TEST(PctList, IrregularSpacingAndLockColumn) {
    std::string out =
        "VMID       Status     Lock         Name\n"
        "100        running                 web\n"
        "101  stopped   backup   db-01\n"
        "102\trunning\t\tcache\n";
    auto list = parse_pct_list(out);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].vmid, 100);
    EXPECT_EQ(list[0].state, ContainerState::Running);
    EXPECT_EQ(list[0].name, "web");
    EXPECT_EQ(list[1].vmid, 101);
    EXPECT_EQ(list[1].status, "stopped");
    EXPECT_EQ(list[1].name, "db-01");
    EXPECT_EQ(list[2].vmid, 102);
    EXPECT_EQ(list[2].name, "cache");
}

TEST(PctList, SkipsJunkAndEmpty) {
    EXPECT_TRUE(parse_pct_list("").empty());
    EXPECT_TRUE(parse_pct_list("VMID Status Lock Name\n\n   \n").empty());
    auto list = parse_pct_list("warning: something\n200 running x\n");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].vmid, 200);
}

TEST(PctStatus, Classification) {
    EXPECT_EQ(parse_pct_status("status: running\n"), ContainerState::Running);
    EXPECT_EQ(parse_pct_status("status: stopped\n"), ContainerState::Stopped);
    EXPECT_EQ(parse_pct_status("status: paused\n"), ContainerState::Unknown);
    EXPECT_EQ(parse_pct_status(""), ContainerState::Unknown);
}

TEST(ExecCommand, QuotesWholeCommandForBash) {
    EXPECT_EQ(ContainerAdapter::exec_command(101, "echo hi"), "pct exec 101 -- bash -c 'echo hi'");
    EXPECT_EQ(ContainerAdapter::exec_command(101, "echo 'hi'"),
              "pct exec 101 -- bash -c 'echo '\\''hi'\\'''");
}

class ContainerAdapterTest : public ::testing::Test {
protected:
    FakeHost host;
    ContainerAdapter adapter{host};

    void SetUp() override {
        host.add_container(100, "web", ContainerState::Running);
        host.add_container(101, "db", ContainerState::Stopped);
    }
};

TEST_F(ContainerAdapterTest, ListSendsOneCommand) {
    auto r = adapter.list();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[1].state, ContainerState::Stopped);
    ASSERT_EQ(host.commands.size(), 1u);
    EXPECT_EQ(host.commands[0], "pct list");
}

TEST_F(ContainerAdapterTest, StatusOfMissingContainer) {
    auto r = adapter.status(555);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TargetNotFound);
}

TEST_F(ContainerAdapterTest, StartRunningSendsNoLifecycleCommand) {
    auto r = adapter.start(100);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.changed);
    EXPECT_EQ(r.value.current, ContainerState::Running);
    EXPECT_FALSE(host.ran("pct start"));
}

TEST_F(ContainerAdapterTest, StopStoppedSendsNoLifecycleCommand) {
    auto r = adapter.stop(101);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.changed);
    EXPECT_FALSE(host.ran("pct stop"));
}

TEST_F(ContainerAdapterTest, StartStoppedTransitions) {
    auto r = adapter.start(101);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.changed);
    EXPECT_EQ(r.value.previous, ContainerState::Stopped);
    EXPECT_EQ(r.value.current, ContainerState::Running);
    EXPECT_TRUE(host.ran("pct start 101"));
}

TEST_F(ContainerAdapterTest, StopRunningTransitions) {
    auto r = adapter.stop(100);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.changed);
    EXPECT_EQ(r.value.current, ContainerState::Stopped);
}

TEST_F(ContainerAdapterTest, RunDeliversCommandIntact) {
    std::string cmd = "echo 'a b' | grep \"$HOME\" && echo `id`";
    auto r = adapter.run(100, cmd, 30);
    ASSERT_TRUE(r.is_ok()) << r.error;
    // The fake echoes back what bash -c would have received
    EXPECT_EQ(r.value.stdout_data, cmd);
    EXPECT_EQ(r.value.exit_code, 0);
}

TEST_F(ContainerAdapterTest, NonZeroExitIsStillOk) {
    auto r = adapter.run(101, "true", 30);  // stopped container: pct exits 255
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_code, 255);
}

TEST_F(ContainerAdapterTest, FileProbes) {
    host.containers[100].files["/etc/app.conf"] = FakeFile{"x", 0640};

    auto exists = adapter.file_exists(100, "/etc/app.conf");
    ASSERT_TRUE(exists.is_ok());
    EXPECT_TRUE(exists.value);
    auto missing = adapter.file_exists(100, "/etc/nope");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value);

    auto mode = adapter.file_mode(100, "/etc/app.conf");
    ASSERT_TRUE(mode.is_ok()) << mode.error;
    EXPECT_EQ(mode.value, 0640u);

    ASSERT_TRUE(adapter.set_mode(100, "/etc/app.conf", "600").is_ok());
    EXPECT_EQ(host.containers[100].files["/etc/app.conf"].mode, 0600u);
}

TEST_F(ContainerAdapterTest, CopyOutOfMissingFileIsIndirectionFailure) {
    auto r = adapter.copy_out(100, "/nope", "/tmp/pxrelay-x");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::IndirectionFailed);
}

TEST_F(ContainerAdapterTest, NotConnectedSendsNothing) {
    host.connected = false;
    auto r = adapter.list();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
    EXPECT_TRUE(host.commands.empty());
}
