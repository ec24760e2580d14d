#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, then the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
