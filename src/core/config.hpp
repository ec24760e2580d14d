#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Looks up an environment variable; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

class Config {
public:
    // Load from an explicit YAML file.
    static Result<Config> load_file(const fs::path& path);

    // Load ~/.pxrelay/config.yaml (or $PXRELAY_CONFIG) if present, then apply
    // environment overrides. A missing file is not an error: the environment
    // alone may carry the whole configuration.
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // HOST, SSH_PORT, SSH_USERNAME, SSH_PASSWORD, SSH_KEY, SSH_KEY_PASSPHRASE,
    // I_ACCEPT_RISKS, ENABLE_HOST_EXEC, CHARACTER_LIMIT, MAX_FILE_SIZE,
    // STAGING_PREFIX
    void apply_env_overrides(const EnvLookup& env);

    // Risk acceptance, host present, exactly one credential, sane limits.
    Result<void> validate() const;

    // Accessors
    const HostConfig& host() const { return host_; }
    const TransferLimits& transfer() const { return transfer_; }
    bool accept_risks() const { return accept_risks_; }
    bool enable_host_exec() const { return enable_host_exec_; }
    int character_limit() const { return character_limit_; }
    const std::string& log_file() const { return log_file_; }
    const fs::path& source_path() const { return source_path_; }

public:
    Config() = default;

private:
    HostConfig host_;
    TransferLimits transfer_;
    bool accept_risks_ = false;
    bool enable_host_exec_ = false;
    int character_limit_ = 25000;
    std::string log_file_;
    fs::path source_path_;

    friend class ConfigBuilder;
};

// Exactly one of password / key must be set.
Result<void> validate_credentials(const HostConfig& host);

// Get paths
fs::path get_config_dir();
fs::path get_default_config_path();

bool config_exists(const fs::path& path = get_default_config_path());

// Create a commented default config at the given path (no-op if it exists).
Result<void> create_default_config(const fs::path& path = get_default_config_path());
