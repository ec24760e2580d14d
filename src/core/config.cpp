#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

class ConfigBuilder {
public:
    static void parse_host(const YAML::Node& node, HostConfig& host) {
        if (!node || !node.IsMap()) return;
        host.host = node["address"].as<std::string>(node["host"].as<std::string>(""));
        host.port = node["port"].as<int>(22);
        host.user = node["user"].as<std::string>("root");
        host.timeout = node["timeout"].as<int>(10);

        // Empty strings in the YAML mean "not set"
        auto opt = [&](const char* key) -> std::optional<std::string> {
            std::string v = node[key].as<std::string>("");
            if (v.empty()) return std::nullopt;
            return v;
        };
        host.password = opt("password");
        host.ssh_key_path = opt("ssh_key_path");
        host.key_passphrase = opt("key_passphrase");
    }

    static void parse_transfer(const YAML::Node& node, TransferLimits& t) {
        if (!node || !node.IsMap()) return;
        t.max_file_size = node["max_file_size"].as<int64_t>(DEFAULT_MAX_FILE_SIZE);
        t.staging_prefix = node["staging_prefix"].as<std::string>(DEFAULT_STAGING_PREFIX);
    }

    static Config from_yaml(const YAML::Node& root, const fs::path& source) {
        Config config;
        config.source_path_ = source;
        parse_host(root["host"], config.host_);
        parse_transfer(root["transfer"], config.transfer_);
        config.accept_risks_ = root["accept_risks"].as<bool>(false);
        config.enable_host_exec_ = root["enable_host_exec"].as<bool>(false);
        config.character_limit_ = root["character_limit"].as<int>(DEFAULT_CHARACTER_LIMIT);
        config.log_file_ = root["log_file"].as<std::string>("");
        return config;
    }
};

static bool env_truthy(const char* v) {
    return v && to_lower(v) == "true";
}

fs::path get_config_dir() {
    return platform::home_dir() / ".pxrelay";
}

fs::path get_default_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

Result<void> create_default_config(const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return Result<void>::Ok();
    }
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::ConfigError,
            "Failed to create config directory " + path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# pxrelay configuration
# Environment variables (HOST, SSH_PORT, SSH_USERNAME, SSH_PASSWORD, SSH_KEY,
# I_ACCEPT_RISKS, ENABLE_HOST_EXEC, CHARACTER_LIMIT, MAX_FILE_SIZE) override
# the values below.

host:
  address: ""
  port: 22
  user: "root"
  password: ""            # set exactly one of password / ssh_key_path
  ssh_key_path: ""
  key_passphrase: ""
  timeout: 10

# Must be true before any connection is attempted.
accept_risks: false

# Allows host-exec and direct host file transfers.
enable_host_exec: false

character_limit: 25000

transfer:
  max_file_size: 10485760
  staging_prefix: "/tmp/pxrelay-"

# Empty: <tmp>/pxrelay_debug.log
log_file: ""
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 "Failed to create config file at " + path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   "Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap() && !root.IsNull()) {
            return Result<Config>::Err(ErrorKind::ConfigError,
                                       "Config root must be a mapping: " + path.string());
        }
        return Result<Config>::Ok(ConfigBuilder::from_yaml(root, path));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    fs::path file;
    if (path.has_value()) {
        file = *path;
    } else if (const char* env_path = std::getenv("PXRELAY_CONFIG")) {
        file = expand_home(env_path);
    } else {
        file = get_default_config_path();
    }

    Config config;
    if (config_exists(file)) {
        auto loaded = load_file(file);
        if (loaded.is_err()) return loaded;
        config = loaded.value;
    } else if (path.has_value()) {
        // Explicitly named file must exist
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   "Config not found at " + file.string());
    }

    config.apply_env_overrides([](const char* name) { return std::getenv(name); });
    return Result<Config>::Ok(config);
}

void Config::apply_env_overrides(const EnvLookup& env) {
    if (const char* v = env("HOST")) host_.host = v;
    if (const char* v = env("SSH_PORT")) host_.port = safe_stoi(v, host_.port);
    if (const char* v = env("SSH_USERNAME")) host_.user = v;
    if (const char* v = env("SSH_PASSWORD")) {
        if (*v) host_.password = std::string(v);
    }
    if (const char* v = env("SSH_KEY")) {
        if (*v) host_.ssh_key_path = std::string(v);
    }
    if (const char* v = env("SSH_KEY_PASSPHRASE")) {
        if (*v) host_.key_passphrase = std::string(v);
    }
    if (const char* v = env("I_ACCEPT_RISKS")) accept_risks_ = env_truthy(v);
    if (const char* v = env("ENABLE_HOST_EXEC")) enable_host_exec_ = env_truthy(v);
    if (const char* v = env("CHARACTER_LIMIT")) character_limit_ = safe_stoi(v, character_limit_);
    if (const char* v = env("MAX_FILE_SIZE")) {
        transfer_.max_file_size = safe_stoll(v, transfer_.max_file_size);
    }
    if (const char* v = env("STAGING_PREFIX")) {
        if (*v) transfer_.staging_prefix = v;
    }
}

Result<void> validate_credentials(const HostConfig& host) {
    bool has_password = host.password.has_value() && !host.password->empty();
    bool has_key = host.ssh_key_path.has_value() && !host.ssh_key_path->empty();
    if (has_password && has_key) {
        return Result<void>::Err(ErrorKind::ConfigError,
            "Both a password and an SSH key are configured; set exactly one");
    }
    if (!has_password && !has_key) {
        return Result<void>::Err(ErrorKind::ConfigError,
            "Either SSH_PASSWORD or SSH_KEY must be set");
    }
    return Result<void>::Ok();
}

Result<void> Config::validate() const {
    // Risk acceptance comes first
    if (!accept_risks_) {
        return Result<void>::Err(ErrorKind::ConfigError,
            "Risks not accepted. Set I_ACCEPT_RISKS=true (or accept_risks: true) to "
            "acknowledge that this tool runs arbitrary commands on your infrastructure.");
    }
    if (host_.host.empty()) {
        return Result<void>::Err(ErrorKind::ConfigError, "HOST is required");
    }
    if (host_.port <= 0 || host_.port > 65535) {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 fmt::format("Invalid SSH port: {}", host_.port));
    }
    auto creds = validate_credentials(host_);
    if (creds.is_err()) return creds;

    if (transfer_.max_file_size <= 0) {
        return Result<void>::Err(ErrorKind::ConfigError, "max_file_size must be positive");
    }
    if (transfer_.staging_prefix.empty() || transfer_.staging_prefix[0] != '/') {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 "staging_prefix must be an absolute host path prefix");
    }
    if (transfer_.staging_prefix.find("..") != std::string::npos) {
        return Result<void>::Err(ErrorKind::ConfigError, "staging_prefix cannot contain '..'");
    }
    if (character_limit_ <= 0) {
        return Result<void>::Err(ErrorKind::ConfigError, "character_limit must be positive");
    }
    return Result<void>::Ok();
}
