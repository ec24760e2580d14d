#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
int64_t safe_stoll(const std::string& s, int64_t fallback = -1);

// Random lowercase hex string of `bytes * 2` characters.
std::string random_hex_token(size_t bytes = 16);

// Expand a leading "~/" to the user's home directory.
std::filesystem::path expand_home(const std::string& path);

std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
