#include "output_format.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <transfer/staging.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    std::string v = to_lower(s);
    if (v == "text") return OutputFormat::Text;
    if (v == "yaml") return OutputFormat::Yaml;
    return std::nullopt;
}

std::string truncate_output(const std::string& output, int limit) {
    if (limit <= 0 || output.size() <= static_cast<size_t>(limit)) return output;
    return output.substr(0, static_cast<size_t>(limit)) +
           fmt::format("\n\n[OUTPUT TRUNCATED - showing first {} of {} characters]", limit, output.size());
}

// Multi-line values read better as literal blocks; the emitter falls back
// to a quoted scalar when a literal cannot represent the text.
static void emit_text(YAML::Emitter& out, const std::string& s) {
    if (s.find('\n') != std::string::npos) {
        out << YAML::Literal << s;
    } else {
        out << s;
    }
}

std::string format_exec_output(const CommandResult& result, OutputFormat format, int limit) {
    if (format == OutputFormat::Text) {
        std::vector<std::string> parts;
        if (!result.stdout_data.empty()) parts.push_back("=== STDOUT ===\n" + result.stdout_data);
        if (!result.stderr_data.empty()) parts.push_back("=== STDERR ===\n" + result.stderr_data);
        if (result.timed_out) parts.push_back("=== TIMED OUT (partial output) ===");
        parts.push_back(fmt::format("=== EXIT CODE: {} ===", result.exit_code));

        std::string text;
        for (size_t i = 0; i < parts.size(); i++) {
            if (i > 0) text += "\n\n";
            text += parts[i];
        }
        return truncate_output(text, limit);
    }

    // Structured: cut the streams first, proportionally to their sizes
    size_t available = static_cast<size_t>(
        std::max(limit - STRUCTURED_OVERHEAD_CHARS, STRUCTURED_MIN_DATA_CHARS));
    std::string out_s = result.stdout_data;
    std::string err_s = result.stderr_data;
    size_t out_len = out_s.size();
    size_t err_len = err_s.size();
    size_t total = out_len + err_len;
    bool out_cut = false;
    bool err_cut = false;

    if (total > available) {
        size_t out_limit = static_cast<size_t>(static_cast<double>(available) * out_len / total);
        size_t err_limit = static_cast<size_t>(static_cast<double>(available) * err_len / total);
        if (out_len > out_limit) {
            out_s.resize(out_limit);
            out_cut = true;
        }
        if (err_len > err_limit) {
            err_s.resize(err_limit);
            err_cut = true;
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "exit_code" << YAML::Value << result.exit_code;
    out << YAML::Key << "success" << YAML::Value << result.success();
    out << YAML::Key << "timed_out" << YAML::Value << result.timed_out;
    out << YAML::Key << "stdout" << YAML::Value;
    emit_text(out, out_s);
    out << YAML::Key << "stderr" << YAML::Value;
    emit_text(out, err_s);
    if (out_cut) {
        out << YAML::Key << "stdout_truncated" << YAML::Value << true;
        out << YAML::Key << "stdout_original_length" << YAML::Value << out_len;
    }
    if (err_cut) {
        out << YAML::Key << "stderr_truncated" << YAML::Value << true;
        out << YAML::Key << "stderr_original_length" << YAML::Value << err_len;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::string format_container_list(const std::vector<ContainerInfo>& containers, OutputFormat format) {
    if (format == OutputFormat::Yaml) {
        YAML::Emitter out;
        out << YAML::BeginSeq;
        for (const auto& c : containers) {
            out << YAML::BeginMap;
            out << YAML::Key << "vmid" << YAML::Value << c.vmid;
            out << YAML::Key << "status" << YAML::Value << c.status;
            out << YAML::Key << "name" << YAML::Value << c.name;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        return std::string(out.c_str()) + "\n";
    }

    if (containers.empty()) return "No containers found\n";

    std::string text = fmt::format("{:<10} | {:<8} | {}\n", "VMID", "Status", "Name");
    text += std::string(40, '-') + "\n";
    for (const auto& c : containers) {
        text += fmt::format("{:<10} | {:<8} | {}\n", c.vmid, c.status, c.name);
    }
    return text;
}

std::string format_container_status(long vmid, ContainerState state, OutputFormat format) {
    if (format == OutputFormat::Yaml) {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "vmid" << YAML::Value << vmid;
        out << YAML::Key << "status" << YAML::Value << container_state_name(state);
        out << YAML::EndMap;
        return std::string(out.c_str()) + "\n";
    }
    return fmt::format("Container {} is {}\n", vmid, container_state_name(state));
}

std::string format_operation_yaml(const OperationResult& result) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "success" << YAML::Value << result.success;
    if (!result.message.empty()) {
        out << YAML::Key << (result.success ? "message" : "error") << YAML::Value << result.message;
    }
    if (!result.success) {
        out << YAML::Key << "error_kind" << YAML::Value << error_kind_name(result.kind);
    }
    if (!result.suggestion.empty()) {
        out << YAML::Key << "suggestion" << YAML::Value << result.suggestion;
    }

    if (result.lifecycle) {
        const auto& l = *result.lifecycle;
        out << YAML::Key << "vmid" << YAML::Value << l.vmid;
        out << YAML::Key << "previous" << YAML::Value << container_state_name(l.previous);
        out << YAML::Key << "current" << YAML::Value << container_state_name(l.current);
        out << YAML::Key << "changed" << YAML::Value << l.changed;
    }

    if (result.transfer) {
        const auto& t = *result.transfer;
        out << YAML::Key << "direction" << YAML::Value << transfer_direction_name(t.direction);
        if (t.vmid != 0) out << YAML::Key << "vmid" << YAML::Value << t.vmid;
        out << YAML::Key << "source" << YAML::Value << t.source;
        out << YAML::Key << "destination" << YAML::Value << t.destination;
        out << YAML::Key << "state" << YAML::Value << transfer_state_name(t.state);
        out << YAML::Key << "bytes_transferred" << YAML::Value << t.bytes_transferred;
        if (!t.permissions.empty()) out << YAML::Key << "permissions" << YAML::Value << t.permissions;
        if (t.mode) out << YAML::Key << "mode" << YAML::Value << fmt::format("{:o}", *t.mode);
    }

    if (!result.warnings.empty()) {
        out << YAML::Key << "warnings" << YAML::Value << YAML::BeginSeq;
        for (const auto& w : result.warnings) out << w;
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}
