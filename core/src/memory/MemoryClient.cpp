// In-memory implementation: a map of normalized paths to nodes.
#include "termxfer/MemoryClient.hpp"
#include "termxfer/PathUtil.hpp"
#include <algorithm>
#include <cstdio>
#include <vector>

namespace termxfer {

MemoryClient::MemoryClient(std::string home) : home_(normalizePath(home.empty() ? "/" : home)) {
    Node root;
    root.kind = FileKind::Directory;
    root.mode = 0755;
    nodes_["/"] = root;
    addDirectory(home_);
}

std::unique_ptr<MemoryClient> MemoryClient::withDemoTree() {
    auto c = std::make_unique<MemoryClient>("/home/demo");
    c->addFile("/readme.txt", "termxfer in-memory remote\n");
    c->addFile("/home/demo/notes.md", "# Notes\n\n- try the sync browsing toggle\n");
    c->addDirectory("/home/demo/projects");
    c->addFile("/home/demo/projects/hello.c", "int main(void) { return 0; }\n");
    c->addDirectory("/home/guest");
    c->addDirectory("/var/log");
    c->addFile("/var/log/messages", "boot ok\n");
    return c;
}

bool MemoryClient::ready(std::string& err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool MemoryClient::connect(std::string& err) {
    ++connectCount_;
    if (refuse_) {
        err = "Connection refused";
        return false;
    }
    if (connectFailures_ > 0) {
        --connectFailures_;
        err = "Connection refused";
        return false;
    }
    connected_ = true;
    return true;
}

void MemoryClient::disconnect() {
    connected_ = false;
}

bool MemoryClient::workingDirectory(std::string& out, std::string& err) {
    if (!ready(err)) return false;
    out = home_;
    return true;
}

void MemoryClient::addDirectory(const std::string& path) {
    std::string p = normalizePath(path);
    std::vector<std::string> chain;
    while (p != "/") {
        chain.push_back(p);
        p = parentPath(p);
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (nodes_.count(*it)) continue;
        Node n;
        n.kind = FileKind::Directory;
        n.mode = 0755;
        n.mtime = clock_;
        nodes_[*it] = n;
    }
}

void MemoryClient::addFile(const std::string& path, const std::string& data, std::uint64_t mtime) {
    const std::string p = normalizePath(path);
    addDirectory(parentPath(p));
    Node n;
    n.data = data;
    n.mtime = mtime ? mtime : ++clock_;
    nodes_[p] = n;
}

std::optional<std::string> MemoryClient::fileData(const std::string& path) const {
    auto it = nodes_.find(normalizePath(path));
    if (it == nodes_.end() || it->second.kind != FileKind::File) return std::nullopt;
    return it->second.data;
}

bool MemoryClient::contains(const std::string& path) const {
    return nodes_.count(normalizePath(path)) != 0;
}

bool MemoryClient::hasChildren(const std::string& dir) const {
    for (const auto& kv : nodes_) {
        if (kv.first != dir && parentPath(kv.first) == dir) return true;
    }
    return false;
}

FileEntry MemoryClient::entryFor(const std::string& path, const Node& n) const {
    FileEntry e;
    e.name = baseName(path);
    e.path = path;
    e.kind = n.kind;
    e.size = n.kind == FileKind::File ? n.data.size() : 0;
    e.mtime = n.mtime;
    e.mode = n.mode;
    if (n.kind == FileKind::Symlink) {
        e.symlink_target = n.target;
        auto t = nodes_.find(resolvePath(parentPath(path), n.target));
        e.symlink_to_dir = t != nodes_.end() && t->second.kind == FileKind::Directory;
    }
    return e;
}

bool MemoryClient::list(const std::string& remote_path,
                        std::vector<FileEntry>& out,
                        std::string& err) {
    if (!ready(err)) return false;
    if (failNextList_) {
        err = *failNextList_;
        failNextList_.reset();
        return false;
    }
    const std::string path = normalizePath(remote_path.empty() ? "/" : remote_path);
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        err = "No such directory: " + path;
        return false;
    }
    if (it->second.kind != FileKind::Directory) {
        err = "Not a directory: " + path;
        return false;
    }
    std::vector<FileEntry> entries;
    for (const auto& kv : nodes_) {
        if (kv.first == "/" || parentPath(kv.first) != path) continue;
        entries.push_back(entryFor(kv.first, kv.second));
    }
    out = std::move(entries);
    return true;
}

bool MemoryClient::get(const std::string& remote,
                       const std::string& local,
                       std::string& err,
                       ProgressCB progress,
                       CancelCB shouldCancel,
                       bool resume) {
    if (!ready(err)) return false;
    auto it = nodes_.find(normalizePath(remote));
    if (it == nodes_.end() || it->second.kind != FileKind::File) {
        err = "No such file: " + remote;
        return false;
    }
    const std::string data = it->second.data;
    const std::size_t total = data.size();

    std::size_t done = 0;
    FILE* lf = nullptr;
    if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            long cur = std::ftell(lf);
            if (cur > 0 && (std::size_t)cur < total) {
                done = (std::size_t)cur;
            } else {
                std::fclose(lf);
                lf = nullptr;
            }
        }
    }
    if (!lf) lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Could not open local file for writing: " + local;
        return false;
    }

    bool ok = true;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            ok = false;
            break;
        }
        std::size_t n = std::min(chunk_, total - done);
        bool drop = false;
        if (dropAfter_) {
            if (n > *dropAfter_) {
                n = *dropAfter_;
                drop = true;
            } else {
                *dropAfter_ -= n;
            }
        }
        if (n && std::fwrite(data.data() + done, 1, n, lf) != n) {
            err = "Local write failed: " + local;
            ok = false;
            break;
        }
        done += n;
        if (n && progress) progress(done, total);
        if (drop) {
            dropAfter_.reset();
            connected_ = false;
            err = "Connection lost";
            ok = false;
            break;
        }
    }
    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    if (ok && total == 0 && progress) progress(0, 0);
    return ok;
}

bool MemoryClient::put(const std::string& local,
                       const std::string& remote,
                       std::string& err,
                       ProgressCB progress,
                       CancelCB shouldCancel,
                       bool resume) {
    if (!ready(err)) return false;
    const std::string path = normalizePath(remote);
    auto parent = nodes_.find(parentPath(path));
    if (parent == nodes_.end() || parent->second.kind != FileKind::Directory) {
        err = "No such directory: " + parentPath(path);
        return false;
    }
    auto existing = nodes_.find(path);
    if (existing != nodes_.end() && existing->second.kind == FileKind::Directory) {
        err = "Is a directory: " + path;
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading: " + local;
        return false;
    }
    std::string data;
    char buf[8192];
    std::size_t r;
    while ((r = std::fread(buf, 1, sizeof(buf), lf)) > 0) data.append(buf, r);
    const bool readFailed = std::ferror(lf) != 0;
    std::fclose(lf);
    if (readFailed) {
        err = "Local read failed: " + local;
        return false;
    }
    const std::size_t total = data.size();

    Node& node = nodes_[path];
    node.kind = FileKind::File;
    std::size_t done = 0;
    if (resume && node.data.size() < total) {
        done = node.data.size();
    } else {
        node.data.clear();
    }
    node.mtime = ++clock_;

    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            return false;
        }
        std::size_t n = std::min(chunk_, total - done);
        bool drop = false;
        if (dropAfter_) {
            if (n > *dropAfter_) {
                n = *dropAfter_;
                drop = true;
            } else {
                *dropAfter_ -= n;
            }
        }
        node.data.append(data, done, n);
        done += n;
        bytesPut_ += n;
        if (n && progress) progress(done, total);
        if (drop) {
            dropAfter_.reset();
            connected_ = false;
            err = "Connection lost";
            return false;
        }
    }
    if (total == 0 && progress) progress(0, 0);
    return true;
}

bool MemoryClient::exists(const std::string& remote_path,
                          bool& isDir,
                          std::string& err) {
    isDir = false;
    if (!ready(err)) return false;
    const std::string path = normalizePath(remote_path);
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        err.clear();
        return false;
    }
    isDir = entryFor(path, it->second).isDir();
    return true;
}

bool MemoryClient::stat(const std::string& remote_path,
                        FileEntry& info,
                        std::string& err) {
    if (!ready(err)) return false;
    const std::string path = normalizePath(remote_path);
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        err.clear();
        return false;
    }
    info = entryFor(path, it->second);
    return true;
}

bool MemoryClient::mkdir(const std::string& remote_dir,
                         std::string& err,
                         unsigned int mode) {
    if (!ready(err)) return false;
    const std::string path = normalizePath(remote_dir);
    if (nodes_.count(path)) {
        err = "File exists: " + path;
        return false;
    }
    auto parent = nodes_.find(parentPath(path));
    if (parent == nodes_.end() || parent->second.kind != FileKind::Directory) {
        err = "No such directory: " + parentPath(path);
        return false;
    }
    Node n;
    n.kind = FileKind::Directory;
    n.mode = mode;
    n.mtime = ++clock_;
    nodes_[path] = n;
    return true;
}

bool MemoryClient::removeFile(const std::string& remote_path,
                              std::string& err) {
    if (!ready(err)) return false;
    auto it = nodes_.find(normalizePath(remote_path));
    if (it == nodes_.end()) {
        err = "No such file: " + remote_path;
        return false;
    }
    if (it->second.kind == FileKind::Directory) {
        err = "Is a directory: " + remote_path;
        return false;
    }
    nodes_.erase(it);
    return true;
}

bool MemoryClient::removeDir(const std::string& remote_dir,
                             std::string& err) {
    if (!ready(err)) return false;
    const std::string path = normalizePath(remote_dir);
    auto it = nodes_.find(path);
    if (it == nodes_.end() || it->second.kind != FileKind::Directory) {
        err = "No such directory: " + path;
        return false;
    }
    if (path == "/" || hasChildren(path)) {
        err = "Directory not empty: " + path;
        return false;
    }
    nodes_.erase(it);
    return true;
}

bool MemoryClient::rename(const std::string& from,
                          const std::string& to,
                          std::string& err,
                          bool overwrite) {
    if (!ready(err)) return false;
    const std::string src = normalizePath(from);
    const std::string dst = normalizePath(to);
    if (!nodes_.count(src)) {
        err = "No such file: " + src;
        return false;
    }
    if (nodes_.count(dst) && !overwrite) {
        err = "File exists: " + dst;
        return false;
    }
    if (!nodes_.count(parentPath(dst))) {
        err = "No such directory: " + parentPath(dst);
        return false;
    }
    if (isUnder(dst, src)) {
        err = "Cannot move a directory into itself";
        return false;
    }
    std::vector<std::pair<std::string, Node>> moved;
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        if (isUnder(it->first, src)) {
            moved.emplace_back(dst + it->first.substr(src.size()), it->second);
            it = nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& m : moved) nodes_[m.first] = m.second;
    return true;
}

bool MemoryClient::symlink(const std::string& target,
                           const std::string& link_path,
                           std::string& err) {
    if (!ready(err)) return false;
    const std::string path = normalizePath(link_path);
    if (nodes_.count(path)) {
        err = "File exists: " + path;
        return false;
    }
    if (!nodes_.count(parentPath(path))) {
        err = "No such directory: " + parentPath(path);
        return false;
    }
    Node n;
    n.kind = FileKind::Symlink;
    n.target = target;
    n.mode = 0777;
    n.mtime = ++clock_;
    nodes_[path] = n;
    return true;
}

bool MemoryClient::exec(const std::string& command,
                        std::string& output,
                        std::string& err) {
    if (!ready(err)) return false;
    if (!execHandler_) {
        err = "exec is not supported by this server";
        return false;
    }
    output = execHandler_(command);
    return true;
}

} // namespace termxfer
