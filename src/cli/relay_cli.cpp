#include "relay_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <util/shell_quote.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

RelayCLI::RelayCLI() : BaseCLI() {
    register_all_commands();
}

void RelayCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Disconnect and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Disconnect and exit");

    register_container_commands(*this);
    register_exec_commands(*this);
    register_transfer_commands(*this);
    register_connection_commands(*this);
}

void RelayCLI::shutdown() {
    if (service) {
        service->disconnect();
        service.reset();
    }
}

std::string RelayCLI::join_argv(const std::vector<std::string>& args) {
    std::string line;
    bool raw = false;
    for (const auto& a : args) {
        if (!line.empty()) line += " ";
        if (raw) {
            line += a;
        } else if (a == "--") {
            line += a;
            raw = true;
        } else {
            line += shell_quote(a);
        }
    }
    return line;
}

int RelayCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (command == "help" || command == "init") {
        return execute_command(command, join_argv(args));
    }
    int rc = execute_command(command, join_argv(args));
    shutdown();
    return rc;
}

int RelayCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Connecting");
    if (!require_connection()) {
        std::cout << "\n";
        return 1;
    }
    std::cout << theme::ok("Connected to " + service->target());

    std::cout << theme::section("Connected");
    std::cout << theme::kv("Host", config->host().host);
    std::cout << theme::kv("User", config->host().user);
    std::cout << theme::kv("Host ops", config->enable_host_exec() ? "enabled" : "disabled");
    std::cout << theme::kv("Log", relay_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    int last_status = 0;
    bool reported_lost = false;
    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        last_status = execute_command(command, args);

        // Report a dropped session once; the user decides when to reconnect
        bool alive = service && service->check_alive();
        if (!alive && !reported_lost && !quit_requested_) {
            std::cout << "\n" << theme::divider();
            std::cout << theme::fail("Connection to host lost.");
            std::cout << theme::step("Run 'reconnect' to open a new session.");
            std::cout << "\n";
        }
        reported_lost = !alive;
    }

    std::cout << theme::dim("Disconnecting...") << "\n";
    shutdown();
    return last_status;
}
