// In-memory remote filesystem behind the RemoteClient API.
// Serves the memory:// demo protocol and the test suite; failure hooks simulate a flaky server.
#pragma once
#include "RemoteClient.hpp"
#include <map>
#include <optional>

namespace termxfer {

class MemoryClient : public RemoteClient {
public:
    explicit MemoryClient(std::string home = "/");

    // Small tree to browse when started with memory://
    static std::unique_ptr<MemoryClient> withDemoTree();

    bool connect(std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    std::string description() const override { return "memory://" + home_; }

    bool workingDirectory(std::string& out, std::string& err) override;

    bool list(const std::string& remote_path,
              std::vector<FileEntry>& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err,
             ProgressCB progress = {},
             CancelCB shouldCancel = {},
             bool resume = false) override;

    bool put(const std::string& local,
             const std::string& remote,
             std::string& err,
             ProgressCB progress = {},
             CancelCB shouldCancel = {},
             bool resume = false) override;

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

    // Tree setup; parents are created as needed.
    void addDirectory(const std::string& path);
    void addFile(const std::string& path, const std::string& data, std::uint64_t mtime = 0);
    std::optional<std::string> fileData(const std::string& path) const;
    bool contains(const std::string& path) const;

    // Failure hooks.
    void setConnectFailures(int n) { connectFailures_ = n; }
    void setRefuseConnections(bool refuse) { refuse_ = refuse; }
    // Drop the connection once this many more bytes have been transferred.
    void dropConnectionAfter(std::size_t bytes) { dropAfter_ = bytes; }
    void failNextList(const std::string& message) { failNextList_ = message; }
    void setChunkSize(std::size_t n) { chunk_ = n ? n : 1; }
    void setExecHandler(std::function<std::string(const std::string&)> h) { execHandler_ = std::move(h); }

    int connectCount() const { return connectCount_; }
    std::size_t bytesPut() const { return bytesPut_; }

private:
    struct Node {
        FileKind kind = FileKind::File;
        std::string data;
        std::string target; // symlink target
        std::uint64_t mtime = 0;
        std::uint32_t mode = 0644;
    };

    std::string home_;
    bool connected_ = false;
    std::map<std::string, Node> nodes_; // normalized absolute path -> node
    std::uint64_t clock_ = 1700000000;

    int connectFailures_ = 0;
    bool refuse_ = false;
    std::optional<std::size_t> dropAfter_;
    std::optional<std::string> failNextList_;
    std::size_t chunk_ = 64 * 1024;
    std::function<std::string(const std::string&)> execHandler_;
    int connectCount_ = 0;
    std::size_t bytesPut_ = 0;

    bool ready(std::string& err) const;
    bool hasChildren(const std::string& dir) const;
    FileEntry entryFor(const std::string& path, const Node& n) const;
};

} // namespace termxfer
