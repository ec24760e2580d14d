#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/relay_service.hpp>
#include "output_format.hpp"
#include "arg_parse.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);
    bool has_command(const std::string& name) const;

    // Load and validate the config once; prints the problem on failure.
    bool require_config();

    // Config plus a live session. Connects on first use.
    bool require_connection();

    // Host commands are opt-in (enable_host_exec).
    bool require_host_access();

    // Run a handler and return its status: 0 on success, 1 on failure.
    int execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Print an operation result and record failure in `status`.
    void report(const OperationResult& result, OutputFormat format);

    // Report a failed local check like any other operation result.
    // Returns true when the check passed.
    bool require_ok(const Result<void>& check, OutputFormat format);

    // Mark the current command failed with a message (and optional hint).
    void fail(const std::string& message, const std::string& hint = "");

    // Parse errors or a wrong positional count print `usage` and fail.
    bool check_args(const ParsedArgs& args, size_t positional, const std::string& usage);

    // --format, defaulting to text.
    std::optional<OutputFormat> output_format(const ParsedArgs& args);

    // Positional vmid, range-checked.
    std::optional<long> vmid_arg(const std::string& s);

    // Public state
    std::optional<std::filesystem::path> config_path;
    std::optional<Config> config;
    std::unique_ptr<RelayService> service;
    int status = 0;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
