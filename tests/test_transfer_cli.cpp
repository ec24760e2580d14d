#include <gtest/gtest.h>
#include <cli/relay_cli.hpp>
#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

// Transfer commands must reject bad input locally, before a RelayService
// (and with it a connection) exists.
class TransferCommandTest : public ::testing::Test {
protected:
    fs::path tmp_dir;
    RelayCLI cli;

    void SetUp() override {
        std::random_device rd;
        tmp_dir = fs::temp_directory_path() / ("pxrelay_transfer_cli_test_" + std::to_string(rd()));
        fs::create_directories(tmp_dir);

        Config c;
        c.apply_env_overrides([](const char* name) -> const char* {
            std::string n = name;
            if (n == "HOST") return "127.0.0.1";
            if (n == "SSH_PORT") return "1";
            if (n == "SSH_PASSWORD") return "pw";
            if (n == "I_ACCEPT_RISKS") return "true";
            if (n == "ENABLE_HOST_EXEC") return "true";
            if (n == "MAX_FILE_SIZE") return "8";
            return nullptr;
        });
        cli.config = c;
    }

    void TearDown() override {
        fs::remove_all(tmp_dir);
    }

    std::string write_local(const std::string& name, const std::string& content) {
        fs::path p = tmp_dir / name;
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }

    void expect_rejected_offline(const std::string& command, const std::string& args) {
        EXPECT_EQ(cli.execute_command(command, args), 1) << command << " " << args;
        EXPECT_EQ(cli.service, nullptr) << command << " " << args;
    }
};

TEST_F(TransferCommandTest, OversizedPushNeverConnects) {
    std::string big = write_local("big", "123456789");
    expect_rejected_offline("push", "101 " + big + " /root/big");
    expect_rejected_offline("host-push", big + " /root/big");
}

TEST_F(TransferCommandTest, TraversalNeverConnects) {
    std::string small = write_local("small", "ok");
    expect_rejected_offline("pull", "101 /root/../etc/shadow " + (tmp_dir / "out").string());
    expect_rejected_offline("push", "101 " + small + " /root/../x");
    expect_rejected_offline("host-pull", "/etc/../shadow " + (tmp_dir / "out").string());
    expect_rejected_offline("host-push", small + " /srv/../x");
}

TEST_F(TransferCommandTest, BadPermissionsNeverConnect) {
    std::string small = write_local("small", "ok");
    expect_rejected_offline("push", "101 " + small + " /root/x --perms 999");
    expect_rejected_offline("host-push", small + " /root/x --perms rwx");
}

TEST_F(TransferCommandTest, MissingSourceOrExistingDestinationNeverConnects) {
    std::string existing = write_local("existing", "keep");
    expect_rejected_offline("push", "101 " + (tmp_dir / "absent").string() + " /root/x");
    expect_rejected_offline("pull", "101 /root/x " + existing);
    expect_rejected_offline("host-pull", "/etc/hostname " + existing);
    std::string kept;
    std::ifstream(existing) >> kept;
    EXPECT_EQ(kept, "keep");
}

TEST_F(TransferCommandTest, ValidInputGoesOnToConnect) {
    std::string small = write_local("small", "ok");
    // Port 1 refuses, so the command still fails, but only after connecting.
    EXPECT_EQ(cli.execute_command("push", "101 " + small + " /root/x"), 1);
    EXPECT_NE(cli.service, nullptr);
}
