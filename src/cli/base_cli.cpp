#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

bool BaseCLI::require_config() {
    if (config.has_value()) return true;

    auto loaded = Config::load(config_path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        std::cout << theme::step("Run 'pxrelay init' to write a starting config to "
                                 + get_default_config_path().string());
        return false;
    }
    auto valid = loaded.value.validate();
    if (valid.is_err()) {
        std::cout << theme::fail(valid.error);
        return false;
    }

    config = loaded.value;
    set_relay_log_path(config->log_file());
    relay_log("cli: config loaded" + (config->source_path().empty()
                                      ? std::string(" (environment only)")
                                      : " from " + config->source_path().string()));
    return true;
}

bool BaseCLI::require_connection() {
    if (!require_config()) {
        return false;
    }
    if (!service) {
        service = std::make_unique<RelayService>(config.value());
    }
    if (service->is_connected()) return true;

    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };
    auto result = service->connect(callback);
    if (result.is_err()) {
        std::cout << theme::fail("Connection failed: " + result.error);
        std::string hint = suggestion_for(result.kind);
        if (!hint.empty()) std::cout << theme::step(hint);
        return false;
    }
    return true;
}

bool BaseCLI::require_host_access() {
    if (!require_config()) return false;
    if (!config->enable_host_exec()) {
        fail("Host operations are disabled", suggestion_for(ErrorKind::HostAccessDisabled));
        return false;
    }
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::string& args) {
    status = 0;
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return 1;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        relay_log(fmt::format("cli: '{}' threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        status = 1;
    }
    return status;
}

void BaseCLI::report(const OperationResult& result, OutputFormat format) {
    if (!result.success) status = 1;

    if (format == OutputFormat::Yaml) {
        std::cout << format_operation_yaml(result);
        return;
    }

    if (result.success) {
        std::cout << theme::ok(result.message);
    } else {
        std::cout << theme::fail(fmt::format("{} [{}]", result.message, error_kind_name(result.kind)));
    }
    if (result.transfer && result.success) {
        const auto& t = *result.transfer;
        std::cout << theme::kv("From", t.source);
        std::cout << theme::kv("To", t.destination);
        std::cout << theme::kv("Bytes", std::to_string(t.bytes_transferred));
        if (t.mode) std::cout << theme::kv("Mode", fmt::format("{:o}", *t.mode));
    }
    for (const auto& w : result.warnings) {
        std::cout << theme::warn(w);
    }
    if (!result.success && !result.suggestion.empty()) {
        std::cout << theme::step(result.suggestion);
    }
}

bool BaseCLI::require_ok(const Result<void>& check, OutputFormat format) {
    if (check.is_ok()) return true;
    OperationResult r;
    r.kind = check.kind;
    r.message = check.error;
    r.suggestion = suggestion_for(check.kind);
    report(r, format);
    return false;
}

void BaseCLI::fail(const std::string& message, const std::string& hint) {
    status = 1;
    std::cout << theme::fail(message);
    if (!hint.empty()) std::cout << theme::step(hint);
}

bool BaseCLI::check_args(const ParsedArgs& args, size_t positional, const std::string& usage) {
    if (!args.errors.empty()) {
        fail(args.errors.front(), "Usage: " + usage);
        return false;
    }
    if (args.positional.size() != positional) {
        fail("Wrong number of arguments", "Usage: " + usage);
        return false;
    }
    return true;
}

std::optional<OutputFormat> BaseCLI::output_format(const ParsedArgs& args) {
    std::string name = args.option("format", "text");
    auto format = parse_output_format(name);
    if (!format) fail("Unknown format '" + name + "'", "Use --format text or --format yaml");
    return format;
}

std::optional<long> BaseCLI::vmid_arg(const std::string& s) {
    auto vmid = parse_vmid(s);
    if (!vmid) {
        fail(fmt::format("Invalid container id '{}'", s),
             fmt::format("Container ids are integers from {} to {}", VMID_MIN, VMID_MAX));
    }
    return vmid;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Containers", {"list", "status", "start", "stop", "exec"}},
        {"Transfers",  {"pull", "push"}},
        {"Host",       {"host-exec", "host-pull", "host-push"}},
        {"Connection", {"health", "reconnect"}},
        {"General",    {"init", "help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::ORANGE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::SLATE
                          << fmt::format("    {:<12}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (service && service->is_connected()) {
        return rl_esc(theme::color::ORANGE) + "pxrelay"
             + rl_esc(theme::color::RESET) + ":"
             + rl_esc(theme::color::GREEN) + service->target()
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::ORANGE) + "pxrelay"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::RED) + "offline"
         + rl_esc(theme::color::RESET) + "> ";
}
