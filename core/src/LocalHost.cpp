// Local filesystem bridge on std::filesystem (error_code overloads) and POSIX lstat.
#include "termxfer/LocalHost.hpp"
#include "termxfer/PathUtil.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace termxfer {

namespace {

FileEntry entryFromStat(const std::string& path, const struct stat& st) {
    FileEntry e;
    e.name = baseName(path);
    e.path = path;
    e.size = S_ISREG(st.st_mode) ? (std::uint64_t)st.st_size : 0;
    e.mtime = (std::uint64_t)st.st_mtime;
    e.mode = st.st_mode & 07777;
    if (S_ISDIR(st.st_mode)) {
        e.kind = FileKind::Directory;
    } else if (S_ISLNK(st.st_mode)) {
        e.kind = FileKind::Symlink;
        std::error_code ec;
        e.symlink_target = fs::read_symlink(path, ec).string();
        e.symlink_to_dir = fs::is_directory(path, ec);
    } else {
        e.kind = FileKind::File;
    }
    return e;
}

} // namespace

std::string LocalHost::currentDirectory() {
    std::error_code ec;
    auto p = fs::current_path(ec);
    return ec ? std::string("/") : p.string();
}

bool LocalHost::list(const std::string& dir, std::vector<FileEntry>& out, std::string& err) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = "Could not read directory " + dir + ": " + ec.message();
        return false;
    }
    std::vector<FileEntry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const std::string path = it->path().string();
        struct stat st{};
        if (::lstat(path.c_str(), &st) != 0) continue; // vanished while listing
        entries.push_back(entryFromStat(path, st));
    }
    if (ec) {
        err = "Could not read directory " + dir + ": " + ec.message();
        return false;
    }
    out = std::move(entries);
    return true;
}

bool LocalHost::stat(const std::string& path, FileEntry& info, std::string& err) const {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) err.clear();
        else err = "stat " + path + ": " + std::strerror(errno);
        return false;
    }
    info = entryFromStat(path, st);
    return true;
}

bool LocalHost::exists(const std::string& path, bool& isDir) const {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    isDir = false;
    if (ec || !fs::exists(st)) return false;
    isDir = fs::is_directory(path, ec);
    return true;
}

bool LocalHost::mkdir(const std::string& dir, std::string& err) const {
    std::error_code ec;
    if (!fs::create_directory(dir, ec)) {
        err = "Could not create directory " + dir + (ec ? ": " + ec.message() : ": already exists");
        return false;
    }
    return true;
}

bool LocalHost::mkdirs(const std::string& dir, std::string& err) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        err = "Could not create directory " + dir + ": " + ec.message();
        return false;
    }
    return true;
}

bool LocalHost::remove(const std::string& path, std::string& err) const {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        err = "Could not remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool LocalHost::rename(const std::string& from, const std::string& to, std::string& err) const {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        err = "Could not rename " + from + " to " + to + ": " + ec.message();
        return false;
    }
    return true;
}

bool LocalHost::copy(const std::string& from, const std::string& to, std::string& err) const {
    std::error_code ec;
    fs::copy(from, to,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks,
             ec);
    if (ec) {
        err = "Could not copy " + from + " to " + to + ": " + ec.message();
        return false;
    }
    return true;
}

bool LocalHost::symlink(const std::string& target, const std::string& link_path, std::string& err) const {
    std::error_code ec;
    fs::create_symlink(target, link_path, ec);
    if (ec) {
        err = "Could not create symlink " + link_path + ": " + ec.message();
        return false;
    }
    return true;
}

bool LocalHost::touch(const std::string& path, std::string& err) const {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        err = "Could not create file " + path + ": " + std::strerror(errno);
        return false;
    }
    ::close(fd);
    return true;
}

bool LocalHost::fileSize(const std::string& path, std::uint64_t& size, std::string& err) const {
    std::error_code ec;
    auto n = fs::file_size(path, ec);
    if (ec) {
        err = "Could not stat " + path + ": " + ec.message();
        return false;
    }
    size = (std::uint64_t)n;
    return true;
}

bool LocalHost::exec(const std::string& dir, const std::string& command, std::string& output, std::string& err) const {
    const std::string full = "cd " + shellQuote(dir) + " && (" + command + ") 2>&1";
    FILE* p = ::popen(full.c_str(), "r");
    if (!p) {
        err = "Could not run command: " + std::string(std::strerror(errno));
        return false;
    }
    output.clear();
    char buf[4096];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), p)) > 0) output.append(buf, n);
    int status = ::pclose(p);
    if (status == -1) {
        err = "Could not run command: " + std::string(std::strerror(errno));
        return false;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        err = "Command exited with status " + std::to_string(WEXITSTATUS(status));
        return false;
    }
    return true;
}

} // namespace termxfer
