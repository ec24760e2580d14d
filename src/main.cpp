#include <iostream>
#include <vector>
#include <string>
#include "cli/relay_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::SLATE << "    pxrelay"
              << theme::color::RESET << theme::color::DIM
              << "                          Connect and enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    pxrelay "
              << theme::color::RESET << theme::color::ORANGE << "<command> [args]"
              << theme::color::RESET << theme::color::DIM
              << "         Run one command and exit" << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    pxrelay --config "
              << theme::color::RESET << theme::color::ORANGE << "<path>"
              << theme::color::RESET << theme::color::DIM
              << "          Use another config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    pxrelay help             List commands\n"
              << "    pxrelay --version        Show version\n"
              << "    pxrelay --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        RelayCLI cli;

        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.size() >= 2 && args[0] == "--config") {
            cli.config_path = std::filesystem::path(args[1]);
            args.erase(args.begin(), args.begin() + 2);
        }

        if (args.empty()) {
            return cli.run_repl();
        }

        std::string cmd = args[0];
        if (cmd == "--version") {
            std::cout << theme::color::ORANGE << theme::color::BOLD << "pxrelay"
                      << theme::color::RESET << theme::color::DIM
                      << " version " PXRELAY_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        args.erase(args.begin());
        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
