#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <managers/relay_service.hpp>

// How results are rendered: human text, or a YAML document for scripts.
enum class OutputFormat {
    Text,
    Yaml,
};

// "text" or "yaml" (case-insensitive).
std::optional<OutputFormat> parse_output_format(const std::string& s);

// Cut `output` to `limit` characters and append a notice with the original size.
std::string truncate_output(const std::string& output, int limit);

// Text: STDOUT / STDERR / EXIT CODE sections, truncated as a whole.
// Yaml: stdout and stderr are cut *before* emission, in proportion to their
// sizes, so the document stays well-formed; cut streams get
// <name>_truncated and <name>_original_length keys.
std::string format_exec_output(const CommandResult& result, OutputFormat format, int limit);

std::string format_container_list(const std::vector<ContainerInfo>& containers, OutputFormat format);
std::string format_container_status(long vmid, ContainerState state, OutputFormat format);

// YAML document for any operation: success, message, error kind, suggestion,
// warnings and the lifecycle/transfer payload when present.
std::string format_operation_yaml(const OperationResult& result);
