// Abstract interface for remote filesystem operations. Concrete backends (libssh2,
// in-memory) follow this API so the engine stays decoupled from the protocol.
#pragma once
#include "FileTypes.hpp"
#include <functional>
#include <memory>

namespace termxfer {

class RemoteClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~RemoteClient() = default;

    // Connect and disconnect. Session parameters are given at construction.
    virtual bool connect(std::string& err) = 0;
    virtual void disconnect() = 0;
    // Liveness: false once the transport reported a dropped connection.
    virtual bool isConnected() const = 0;

    // Human readable endpoint, e.g. "sftp://user@host:22"
    virtual std::string description() const = 0;

    // Directory the server put us in after login
    virtual bool workingDirectory(std::string& out, std::string& err) = 0;

    // Remote directory listing
    virtual bool list(const std::string& remote_path,
                      std::vector<FileEntry>& out,
                      std::string& err) = 0;

    // Download a remote file to local; if resume=true, try to continue a partial download.
    // shouldCancel is checked at every chunk boundary.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Upload a local file to remote; if resume=true, try to continue a partial upload
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Detailed metadata (stat). Returns true if it exists.
    virtual bool stat(const std::string& remote_path,
                      FileEntry& info,
                      std::string& err) = 0;

    // Remote file/folder operations
    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err,
                        bool overwrite = false) = 0;

    virtual bool symlink(const std::string& target,
                         const std::string& link_path,
                         std::string& err) = 0;

    // Run a command on the remote host and collect its standard output
    virtual bool exec(const std::string& command,
                      std::string& output,
                      std::string& err) = 0;
};

// Remove a remote file or directory tree (depth first).
bool removeRemoteRecursive(RemoteClient& client, const FileEntry& entry, std::string& err);

} // namespace termxfer
