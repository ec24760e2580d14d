#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <iostream>
#include <fmt/format.h>

// Shared option handling for exec and host-exec. Returns false (with the
// failure already printed) if the command line is unusable.
static bool exec_options(BaseCLI& cli, const ParsedArgs& args, int& timeout, OutputFormat& format) {
    if (!args.has_command || args.command.empty()) {
        cli.fail("Missing command", "Put the command after '--'");
        return false;
    }
    if (args.command.size() > static_cast<size_t>(MAX_COMMAND_LENGTH)) {
        cli.fail(fmt::format("Command is longer than {} characters", MAX_COMMAND_LENGTH));
        return false;
    }

    timeout = SSH_CMD_TIMEOUT_SECS;
    if (args.options.count("timeout")) {
        auto t = parse_timeout(args.option("timeout"));
        if (!t) {
            cli.fail(fmt::format("Invalid timeout '{}'", args.option("timeout")),
                     fmt::format("Timeouts are whole seconds from 1 to {}", SSH_CMD_TIMEOUT_MAX_SECS));
            return false;
        }
        timeout = *t;
    }

    auto f = cli.output_format(args);
    if (!f) return false;
    format = *f;
    return true;
}

// Command output first, then anything the output itself does not show.
static void print_exec(BaseCLI& cli, const OperationResult& r, OutputFormat format) {
    if (!r.command) {
        cli.report(r, format);
        return;
    }
    if (!r.success) cli.status = 1;
    std::cout << format_exec_output(*r.command, format, cli.config->character_limit());
    if (format == OutputFormat::Text && !r.command->timed_out) std::cout << "\n";
    if (format == OutputFormat::Text && r.kind == ErrorKind::CommandTimeout) {
        std::cout << theme::fail(r.message);
        std::cout << theme::step(r.suggestion);
    }
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, {"timeout", "format"});
    if (!cli.check_args(args, 1, "exec <vmid> [--timeout N] [--format text|yaml] -- <command>")) return;
    auto vmid = cli.vmid_arg(args.positional[0]);
    if (!vmid) return;

    int timeout = 0;
    OutputFormat format = OutputFormat::Text;
    if (!exec_options(cli, args, timeout, format)) return;
    if (!cli.require_connection()) {
        cli.status = 1;
        return;
    }

    print_exec(cli, cli.service->container_exec(*vmid, args.command, timeout), format);
}

static void do_host_exec(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, {"timeout", "format"});
    if (!cli.check_args(args, 0, "host-exec [--timeout N] [--format text|yaml] -- <command>")) return;

    int timeout = 0;
    OutputFormat format = OutputFormat::Text;
    if (!exec_options(cli, args, timeout, format)) return;
    if (!cli.require_host_access() || !cli.require_connection()) {
        cli.status = 1;
        return;
    }

    print_exec(cli, cli.service->host_exec(args.command, timeout), format);
}

void register_exec_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command inside a container");
    cli.add_command("host-exec", do_host_exec, "Run a command on the host");
}
