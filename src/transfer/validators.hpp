#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>

// Domain checks run before any transfer touches the transport.
// All of them are pure and cheap; none performs I/O.

// PathInvalid if `path` is empty or blank, contains "..", holds a NUL byte, or
// is longer than MAX_PATH_LENGTH. `label` names the endpoint in the message
// ("container path", "local path", ...).
Result<void> validate_path(const std::string& path, const std::string& label);

// PermissionInvalid unless `perms` is 3 or 4 octal digits ("644", "0755").
Result<void> validate_permissions(const std::string& perms);

// SizeExceedsLimit if `size` is over `ceiling`. Message carries both values.
Result<void> check_size(int64_t size, int64_t ceiling);
