#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path tmp_dir;
    std::map<std::string, std::string> env;

    void SetUp() override {
        std::random_device rd;
        tmp_dir = fs::temp_directory_path() / ("pxrelay_config_test_" + std::to_string(rd()));
        fs::create_directories(tmp_dir);
    }

    void TearDown() override {
        fs::remove_all(tmp_dir);
    }

    fs::path write_config(const std::string& content) {
        fs::path p = tmp_dir / "config.yaml";
        std::ofstream(p) << content;
        return p;
    }

    EnvLookup lookup() {
        return [this](const char* name) -> const char* {
            auto it = env.find(name);
            return it == env.end() ? nullptr : it->second.c_str();
        };
    }

    static Config valid_base() {
        Config c;
        c.apply_env_overrides([](const char* name) -> const char* {
            std::string n = name;
            if (n == "HOST") return "pve.lan";
            if (n == "SSH_PASSWORD") return "secret";
            if (n == "I_ACCEPT_RISKS") return "true";
            return nullptr;
        });
        return c;
    }
};

TEST_F(ConfigTest, LoadsYaml) {
    auto path = write_config(R"(
host:
  address: pve.example.com
  port: 2222
  user: admin
  ssh_key_path: /home/me/.ssh/id_ed25519
accept_risks: true
enable_host_exec: true
character_limit: 5000
transfer:
  max_file_size: 2048
  staging_prefix: /var/tmp/relay-
)");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.host().host, "pve.example.com");
    EXPECT_EQ(c.host().port, 2222);
    EXPECT_EQ(c.host().user, "admin");
    EXPECT_FALSE(c.host().password.has_value());
    EXPECT_EQ(*c.host().ssh_key_path, "/home/me/.ssh/id_ed25519");
    EXPECT_TRUE(c.accept_risks());
    EXPECT_TRUE(c.enable_host_exec());
    EXPECT_EQ(c.character_limit(), 5000);
    EXPECT_EQ(c.transfer().max_file_size, 2048);
    EXPECT_EQ(c.transfer().staging_prefix, "/var/tmp/relay-");
    EXPECT_TRUE(c.validate().is_ok());
}

TEST_F(ConfigTest, Defaults) {
    auto r = Config::load_file(write_config("host:\n  address: h\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.host().port, 22);
    EXPECT_EQ(r.value.host().user, "root");
    EXPECT_FALSE(r.value.enable_host_exec());
    EXPECT_EQ(r.value.character_limit(), 25000);
    EXPECT_EQ(r.value.transfer().max_file_size, 10 * 1024 * 1024);
    EXPECT_EQ(r.value.transfer().staging_prefix, "/tmp/pxrelay-");
}

TEST_F(ConfigTest, MissingExplicitFile) {
    auto r = Config::load(tmp_dir / "absent.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigError);
}

TEST_F(ConfigTest, MalformedYaml) {
    auto r = Config::load_file(write_config("host: [unclosed\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto r = Config::load_file(write_config("host:\n  address: from-file\n  port: 22\n"));
    ASSERT_TRUE(r.is_ok());
    Config c = r.value;

    env["HOST"] = "from-env";
    env["SSH_PORT"] = "2200";
    env["SSH_USERNAME"] = "ops";
    env["SSH_PASSWORD"] = "pw";
    env["I_ACCEPT_RISKS"] = "TRUE";
    env["ENABLE_HOST_EXEC"] = "yes";   // only "true" enables
    env["MAX_FILE_SIZE"] = "4096";
    env["CHARACTER_LIMIT"] = "100";
    c.apply_env_overrides(lookup());

    EXPECT_EQ(c.host().host, "from-env");
    EXPECT_EQ(c.host().port, 2200);
    EXPECT_EQ(c.host().user, "ops");
    EXPECT_EQ(*c.host().password, "pw");
    EXPECT_TRUE(c.accept_risks());
    EXPECT_FALSE(c.enable_host_exec());
    EXPECT_EQ(c.transfer().max_file_size, 4096);
    EXPECT_EQ(c.character_limit(), 100);
}

TEST_F(ConfigTest, RiskAcceptanceCheckedFirst) {
    Config c;  // nothing set at all
    auto r = c.validate();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("I_ACCEPT_RISKS"), std::string::npos);
}

TEST_F(ConfigTest, HostRequired) {
    Config c;
    env["I_ACCEPT_RISKS"] = "true";
    env["SSH_PASSWORD"] = "pw";
    c.apply_env_overrides(lookup());
    auto r = c.validate();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("HOST"), std::string::npos);
}

TEST_F(ConfigTest, ExactlyOneCredential) {
    Config both = valid_base();
    env["SSH_KEY"] = "/root/.ssh/id_rsa";
    both.apply_env_overrides(lookup());
    EXPECT_EQ(both.validate().kind, ErrorKind::ConfigError);

    HostConfig none;
    none.host = "h";
    EXPECT_TRUE(validate_credentials(none).is_err());

    EXPECT_TRUE(valid_base().validate().is_ok());
}

TEST_F(ConfigTest, StagingPrefixMustBeAbsolute) {
    Config c = valid_base();
    env["STAGING_PREFIX"] = "relative-";
    c.apply_env_overrides(lookup());
    EXPECT_EQ(c.validate().kind, ErrorKind::ConfigError);
}

TEST_F(ConfigTest, CreateDefaultConfigLoads) {
    fs::path p = tmp_dir / "sub" / "config.yaml";
    ASSERT_TRUE(create_default_config(p).is_ok());
    ASSERT_TRUE(fs::exists(p));
    auto r = Config::load_file(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.accept_risks());
    EXPECT_FALSE(r.value.host().password.has_value());
}
