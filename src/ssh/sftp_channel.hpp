#pragma once

#include <string>
#include "file_channel.hpp"
#include "session.hpp"

// FileChannel over the session's SFTP subsystem. The subsystem itself is
// owned by SessionManager; this class only borrows it per call.
class SftpChannel : public FileChannel {
public:
    explicit SftpChannel(SessionManager& session);

    Result<RemoteFileInfo> stat(const std::string& remote) override;
    Result<int64_t> get(const std::string& remote, const std::filesystem::path& local) override;
    Result<int64_t> put(const std::filesystem::path& local, const std::string& remote) override;
    Result<void> remove(const std::string& remote) override;

private:
    SessionManager& session_;

    // Fetch the SFTP handle or a NotConnected/TransferIOError result.
    Result<LIBSSH2_SFTP*> channel();

    // Describe the last SFTP failure and invalidate the session if the
    // transport itself is gone.
    std::string fault(const std::string& what, const std::string& path);
};
