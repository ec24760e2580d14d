#include "validators.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <regex>

Result<void> validate_path(const std::string& path, const std::string& label) {
    if (path.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<void>::Err(ErrorKind::PathInvalid,
                                 fmt::format("Invalid {}: path cannot be empty", label));
    }
    if (path.find("..") != std::string::npos) {
        return Result<void>::Err(ErrorKind::PathInvalid,
            fmt::format("Invalid {}: '{}' contains '..' (path traversal not allowed)", label, path));
    }
    if (path.find('\0') != std::string::npos) {
        return Result<void>::Err(ErrorKind::PathInvalid,
                                 fmt::format("Invalid {}: path contains a NUL byte", label));
    }
    if (path.size() > static_cast<size_t>(MAX_PATH_LENGTH)) {
        return Result<void>::Err(ErrorKind::PathInvalid,
            fmt::format("Invalid {}: path exceeds maximum length of {} characters",
                        label, MAX_PATH_LENGTH));
    }
    return Result<void>::Ok();
}

Result<void> validate_permissions(const std::string& perms) {
    static const std::regex octal_mode("^[0-7]{3,4}$");
    if (perms.empty()) {
        return Result<void>::Err(ErrorKind::PermissionInvalid, "Permissions cannot be empty");
    }
    if (!std::regex_match(perms, octal_mode)) {
        return Result<void>::Err(ErrorKind::PermissionInvalid,
            fmt::format("Invalid permissions '{}': expected an octal mode such as 644, 755 or 0644",
                        perms));
    }
    return Result<void>::Ok();
}

Result<void> check_size(int64_t size, int64_t ceiling) {
    if (size > ceiling) {
        return Result<void>::Err(ErrorKind::SizeExceedsLimit,
            fmt::format("File size ({} bytes) exceeds maximum allowed ({} bytes)", size, ceiling));
    }
    return Result<void>::Ok();
}
