#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_health(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Health");

    if (!cli.require_config()) {
        cli.status = 1;
        return;
    }
    const auto& host = cli.config->host();
    std::cout << theme::kv("Config", cli.config->source_path().empty()
                                         ? "environment only"
                                         : cli.config->source_path().string());
    std::cout << theme::kv("Host", fmt::format("{}@{}:{}", host.user, host.host, host.port));
    std::cout << theme::kv("Auth", host.ssh_key_path ? "ssh key" : "password");
    std::cout << theme::kv("Host ops", cli.config->enable_host_exec() ? "enabled" : "disabled");
    std::cout << theme::kv("Max file", fmt::format("{} bytes", cli.config->transfer().max_file_size));

    bool alive = cli.service && cli.service->check_alive();
    std::cout << theme::kv("Session", alive ? theme::green("connected") : theme::red("not connected"));
    std::cout << "\n";
    if (!alive) cli.status = 1;
}

static void do_reconnect(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) {
        cli.status = 1;
        return;
    }
    if (!cli.service) {
        if (!cli.require_connection()) cli.status = 1;
        return;
    }

    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };
    auto r = cli.service->reconnect(callback);
    if (r.is_err()) {
        cli.fail("Reconnect failed: " + r.error, suggestion_for(r.kind));
        return;
    }
    std::cout << theme::ok("Reconnected to " + cli.service->target());
}

static void do_init(BaseCLI& cli, const std::string& arg) {
    auto path = cli.config_path.value_or(get_default_config_path());
    if (config_exists(path)) {
        std::cout << theme::info("Config already exists at " + path.string());
        return;
    }
    auto r = create_default_config(path);
    if (r.is_err()) {
        cli.fail(r.error);
        return;
    }
    std::cout << theme::ok("Wrote " + path.string());
    std::cout << theme::step("Set host.address, one credential, and accept_risks: true");
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("health", do_health, "Show config and session health");
    cli.add_command("reconnect", do_reconnect, "Drop the session and connect again");
    cli.add_command("init", do_init, "Write a starting config file");
}
