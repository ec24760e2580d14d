#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_container_commands(BaseCLI& cli);
void register_exec_commands(BaseCLI& cli);
void register_transfer_commands(BaseCLI& cli);
void register_connection_commands(BaseCLI& cli);

class RelayCLI : public BaseCLI {
public:
    RelayCLI();

    // Connect once and read commands until quit or EOF. The session lives
    // for the whole loop; a dropped connection is reported, not retried.
    int run_repl();

    // One command from argv, then disconnect. Returns the process exit code.
    int run_command(const std::string& command, const std::vector<std::string>& args);

    // Rebuild a command-line string from argv. Words before "--" are quoted
    // so the parser sees them unchanged; the command after "--" is joined
    // with spaces, as ssh does.
    static std::string join_argv(const std::vector<std::string>& args);

private:
    bool quit_requested_ = false;

    void register_all_commands();
    void shutdown();
};
