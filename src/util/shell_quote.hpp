#pragma once

#include <string>

// Wrap `s` in single quotes for a POSIX shell. Each embedded ' becomes '\''
// (close, escaped quote, reopen). The shell hands the original bytes back as
// one word, with no expansion of $, `, \ or newlines.
//
// This is the only place text is quoted for the remote shell.
std::string shell_quote(const std::string& s);
