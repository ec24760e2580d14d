#include "arg_parse.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cctype>

std::string ParsedArgs::option(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

std::vector<std::string> tokenize_args(const std::string& line) {
    std::vector<std::string> tokens;
    std::string cur;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else cur += c;
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\')) {
                cur += line[++i];
            } else {
                cur += c;
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(cur);
                cur.clear();
                in_token = false;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (c == '\\' && i + 1 < line.size()) {
            cur += line[++i];
            in_token = true;
        } else {
            cur += c;
            in_token = true;
        }
    }
    if (in_token) tokens.push_back(cur);
    return tokens;
}

size_t find_command_separator(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
            else if (quote == '"' && c == '\\') i++;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (c == '\\') {
            i++;
            continue;
        }
        bool starts = (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])));
        bool ends = (i + 2 == line.size() ||
                     (i + 2 < line.size() && std::isspace(static_cast<unsigned char>(line[i + 2]))));
        if (c == '-' && i + 1 < line.size() && line[i + 1] == '-' && starts && ends) {
            return i;
        }
    }
    return std::string::npos;
}

ParsedArgs parse_args(const std::string& line, const std::set<std::string>& value_options) {
    ParsedArgs out;
    std::string head = line;

    size_t sep = find_command_separator(line);
    if (sep != std::string::npos) {
        head = line.substr(0, sep);
        out.command = line.substr(sep + 2);
        trim(out.command);
        out.has_command = true;
    }

    auto tokens = tokenize_args(head);
    for (size_t i = 0; i < tokens.size(); i++) {
        const std::string& tok = tokens[i];
        if (tok.size() > 2 && tok.compare(0, 2, "--") == 0) {
            std::string name = tok.substr(2);
            if (value_options.count(name)) {
                if (i + 1 < tokens.size()) {
                    out.options[name] = tokens[++i];
                } else {
                    out.errors.push_back("--" + name + " needs a value");
                }
            } else {
                out.flags.insert(name);
            }
        } else {
            out.positional.push_back(tok);
        }
    }
    return out;
}

std::optional<long> parse_vmid(const std::string& s) {
    if (s.empty() || s.size() > 10 || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    long v = static_cast<long>(safe_stoll(s, -1));
    if (v < VMID_MIN || v > VMID_MAX) return std::nullopt;
    return v;
}

std::optional<int> parse_timeout(const std::string& s) {
    if (s.empty() || s.size() > 6 || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    int v = safe_stoi(s, -1);
    if (v < 1 || v > SSH_CMD_TIMEOUT_MAX_SECS) return std::nullopt;
    return v;
}
