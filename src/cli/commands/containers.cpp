#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_list(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, {"format"});
    if (!cli.check_args(args, 0, "list [--format text|yaml]")) return;
    auto format = cli.output_format(args);
    if (!format || !cli.require_connection()) {
        cli.status = 1;
        return;
    }

    auto r = cli.service->list_containers();
    if (!r.success) {
        cli.report(r, *format);
        return;
    }
    std::cout << format_container_list(r.containers, *format);
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, {"format"});
    if (!cli.check_args(args, 1, "status <vmid> [--format text|yaml]")) return;
    auto vmid = cli.vmid_arg(args.positional[0]);
    auto format = cli.output_format(args);
    if (!vmid || !format || !cli.require_connection()) {
        cli.status = 1;
        return;
    }

    auto r = cli.service->container_status(*vmid);
    if (!r.success) {
        cli.report(r, *format);
        return;
    }
    std::cout << format_container_status(*vmid, *r.state, *format);
}

static void do_lifecycle(BaseCLI& cli, const std::string& arg, bool start) {
    auto args = parse_args(arg, {"format"});
    std::string usage = fmt::format("{} <vmid> [--format text|yaml]", start ? "start" : "stop");
    if (!cli.check_args(args, 1, usage)) return;
    auto vmid = cli.vmid_arg(args.positional[0]);
    auto format = cli.output_format(args);
    if (!vmid || !format || !cli.require_connection()) {
        cli.status = 1;
        return;
    }

    auto r = start ? cli.service->start_container(*vmid) : cli.service->stop_container(*vmid);
    cli.report(r, *format);
}

void register_container_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "List containers (vmid, status, name)");
    cli.add_command("status", do_status, "Show whether a container is running");
    cli.add_command("start", [](BaseCLI& c, const std::string& a) { do_lifecycle(c, a, true); },
                    "Start a container (no-op if running)");
    cli.add_command("stop", [](BaseCLI& c, const std::string& a) { do_lifecycle(c, a, false); },
                    "Stop a container (no-op if stopped)");
}
