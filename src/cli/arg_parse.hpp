#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>

// Arguments of one CLI command line.
//
//   <positional...> [--flag] [--option value] [-- <raw command text>]
//
// Everything after a standalone "--" is kept verbatim as `command` so shell
// syntax in it reaches the remote side untouched.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    std::string command;
    bool has_command = false;
    std::vector<std::string> errors;

    bool flag(const std::string& name) const { return flags.count(name) > 0; }
    std::string option(const std::string& name, const std::string& fallback = "") const;
};

// Split on whitespace, honouring '...', "..." and backslash escapes.
std::vector<std::string> tokenize_args(const std::string& line);

// Offset of the first unquoted standalone "--", or npos.
size_t find_command_separator(const std::string& line);

// `value_options` names the options that take a value (without the dashes).
ParsedArgs parse_args(const std::string& line, const std::set<std::string>& value_options);

// Container id within [VMID_MIN, VMID_MAX].
std::optional<long> parse_vmid(const std::string& s);

// Timeout in seconds within [1, SSH_CMD_TIMEOUT_MAX_SECS].
std::optional<int> parse_timeout(const std::string& s);
