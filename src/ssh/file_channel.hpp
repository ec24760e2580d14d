#pragma once

#include <string>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>

struct RemoteFileInfo {
    int64_t size = 0;
    unsigned mode = 0;          // permission bits (07777), valid if has_mode
    bool has_mode = false;      // server sent the permissions attribute
    bool is_regular = false;
};

// Whole-file byte transfer between the local filesystem and host paths.
// A transfer completes or fails as a unit; no resume.
class FileChannel {
public:
    virtual ~FileChannel() = default;

    // SourceNotFound if the path does not exist.
    virtual Result<RemoteFileInfo> stat(const std::string& remote) = 0;

    // Returns bytes copied. A failed get leaves no partial local file.
    virtual Result<int64_t> get(const std::string& remote, const std::filesystem::path& local) = 0;

    // Creates or truncates `remote` with mode 0600 and returns bytes copied.
    virtual Result<int64_t> put(const std::filesystem::path& local, const std::string& remote) = 0;

    // Removing a path that is already gone succeeds.
    virtual Result<void> remove(const std::string& remote) = 0;
};
