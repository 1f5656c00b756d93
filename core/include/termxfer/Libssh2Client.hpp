// RemoteClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace termxfer {

class Libssh2Client : public RemoteClient {
public:
    explicit Libssh2Client(SessionOptions opt);
    ~Libssh2Client() override;

    bool connect(std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    std::string description() const override;

    bool workingDirectory(std::string& out, std::string& err) override;

    bool list(const std::string& remote_path,
              std::vector<FileEntry>& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;

    bool put(const std::string& local,
             const std::string& remote,
             std::string& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool stat(const std::string& remote_path,
              FileEntry& info,
              std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err,
                bool overwrite = false) override;

    bool symlink(const std::string& target,
                 const std::string& link_path,
                 std::string& err) override;

    bool exec(const std::string& command,
              std::string& output,
              std::string& err) override;

private:
    SessionOptions opt_;
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same

    // TCP connection + SSH handshake and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
    bool verifyHostKey(std::string& err);
    bool authenticate(std::string& err);
    bool authenticateWithAgent();
    // Drop the session state when libssh2 reports a transport failure.
    void checkTransport();
    bool ready(std::string& err) const;
};

} // namespace termxfer
