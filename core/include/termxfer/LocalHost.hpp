// Local filesystem bridge: synchronous operations returning bool + error text,
// mirroring the RemoteClient contract so the engine treats both sides alike.
#pragma once
#include "FileTypes.hpp"
#include <string>
#include <vector>

namespace termxfer {

class LocalHost {
public:
    static std::string currentDirectory();

    bool list(const std::string& dir, std::vector<FileEntry>& out, std::string& err) const;
    // Returns false with an empty err if the path does not exist.
    bool stat(const std::string& path, FileEntry& info, std::string& err) const;
    bool exists(const std::string& path, bool& isDir) const;

    bool mkdir(const std::string& dir, std::string& err) const;
    // Create dir and any missing parents.
    bool mkdirs(const std::string& dir, std::string& err) const;
    // Remove a file, a symlink or a whole directory tree.
    bool remove(const std::string& path, std::string& err) const;
    bool rename(const std::string& from, const std::string& to, std::string& err) const;
    // Copy a file or a directory tree; existing files are overwritten.
    bool copy(const std::string& from, const std::string& to, std::string& err) const;
    bool symlink(const std::string& target, const std::string& link_path, std::string& err) const;
    // Create an empty file; fails if it already exists.
    bool touch(const std::string& path, std::string& err) const;
    bool fileSize(const std::string& path, std::uint64_t& size, std::string& err) const;
    // Run a shell command in dir and capture stdout and stderr.
    bool exec(const std::string& dir, const std::string& command, std::string& output, std::string& err) const;
};

} // namespace termxfer
