#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == 0 ? fallback : v;
    } catch (const std::exception&) {
        return fallback;
    }
}

int64_t safe_stoll(const std::string& s, int64_t fallback) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        return used == 0 ? fallback : static_cast<int64_t>(v);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string random_hex_token(size_t bytes) {
    static const char HEX[] = "0123456789abcdef";
    static thread_local std::mt19937_64 rng(
        std::random_device{}() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));

    std::uniform_int_distribution<int> dist(0, 255);
    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; i++) {
        int b = dist(rng);
        out += HEX[(b >> 4) & 0xF];
        out += HEX[b & 0xF];
    }
    return out;
}

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return platform::home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
