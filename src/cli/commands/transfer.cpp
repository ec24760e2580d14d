#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <transfer/transfer_orchestrator.hpp>
#include <iostream>

static const std::set<std::string> kTransferOptions = {"perms", "format"};

static void do_pull(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, kTransferOptions);
    if (!cli.check_args(args, 3, "pull <vmid> <container_path> <local_path> [--overwrite]")) return;
    auto vmid = cli.vmid_arg(args.positional[0]);
    auto format = cli.output_format(args);
    if (!vmid || !format || !cli.require_config()) {
        cli.status = 1;
        return;
    }
    // Local checks first: bad input never opens a connection
    if (!cli.require_ok(TransferOrchestrator::preflight_download(args.positional[1], "container path",
                                                                 args.positional[2], args.flag("overwrite")),
                        *format)) return;
    if (!cli.require_connection()) {
        cli.status = 1;
        return;
    }

    cli.report(cli.service->download_from_container(*vmid, args.positional[1], args.positional[2],
                                                    args.flag("overwrite")),
               *format);
}

static void do_push(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, kTransferOptions);
    if (!cli.check_args(args, 3,
                        "push <vmid> <local_path> <container_path> [--perms 644] [--overwrite]")) return;
    auto vmid = cli.vmid_arg(args.positional[0]);
    auto format = cli.output_format(args);
    if (!vmid || !format || !cli.require_config()) {
        cli.status = 1;
        return;
    }
    std::string perms = args.option("perms", DEFAULT_PERMISSIONS);
    if (!cli.require_ok(TransferOrchestrator::preflight_upload(args.positional[1], args.positional[2],
                                                               "container path", perms,
                                                               cli.config->transfer().max_file_size),
                        *format)) return;
    if (!cli.require_connection()) {
        cli.status = 1;
        return;
    }

    cli.report(cli.service->upload_to_container(*vmid, args.positional[1], args.positional[2], perms,
                                                args.flag("overwrite")),
               *format);
}

static void do_host_pull(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, kTransferOptions);
    if (!cli.check_args(args, 2, "host-pull <host_path> <local_path> [--overwrite]")) return;
    auto format = cli.output_format(args);
    if (!format || !cli.require_host_access()) {
        cli.status = 1;
        return;
    }
    if (!cli.require_ok(TransferOrchestrator::preflight_download(args.positional[0], "host path",
                                                                 args.positional[1], args.flag("overwrite")),
                        *format)) return;
    if (!cli.require_connection()) {
        cli.status = 1;
        return;
    }

    cli.report(cli.service->download_from_host(args.positional[0], args.positional[1],
                                               args.flag("overwrite")),
               *format);
}

static void do_host_push(BaseCLI& cli, const std::string& arg) {
    auto args = parse_args(arg, kTransferOptions);
    if (!cli.check_args(args, 2, "host-push <local_path> <host_path> [--perms 644] [--overwrite]")) return;
    auto format = cli.output_format(args);
    if (!format || !cli.require_host_access()) {
        cli.status = 1;
        return;
    }
    std::string perms = args.option("perms", DEFAULT_PERMISSIONS);
    if (!cli.require_ok(TransferOrchestrator::preflight_upload(args.positional[0], args.positional[1],
                                                               "host path", perms,
                                                               cli.config->transfer().max_file_size),
                        *format)) return;
    if (!cli.require_connection()) {
        cli.status = 1;
        return;
    }

    cli.report(cli.service->upload_to_host(args.positional[0], args.positional[1], perms,
                                           args.flag("overwrite")),
               *format);
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("pull", do_pull, "Download a file from a container");
    cli.add_command("push", do_push, "Upload a file into a container");
    cli.add_command("host-pull", do_host_pull, "Download a file from the host");
    cli.add_command("host-push", do_host_push, "Upload a file to the host");
}
