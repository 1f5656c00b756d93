// POSIX-style path helpers.
#include "termxfer/PathUtil.hpp"
#include <fnmatch.h>
#include <vector>

namespace termxfer {

std::string normalizePath(const std::string& path) {
    if (path.empty()) return path;
    const bool absolute = path[0] == '/';
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= path.size()) {
        std::size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        std::string part = path.substr(i, j - i);
        if (part.empty() || part == ".") {
            // skip
        } else if (part == "..") {
            if (!parts.empty() && parts.back() != "..") parts.pop_back();
            else if (!absolute) parts.push_back(part);
        } else {
            parts.push_back(part);
        }
        i = j + 1;
    }
    std::string out = absolute ? "/" : "";
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k) out += '/';
        out += parts[k];
    }
    if (out.empty()) out = ".";
    return out;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (name.empty()) return dir;
    if (name[0] == '/') return name;
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string parentPath(const std::string& path) {
    if (path.empty() || path == "/") return "/";
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

bool isUnder(const std::string& path, const std::string& root) {
    if (root == "/") return !path.empty() && path[0] == '/';
    if (path.size() < root.size()) return false;
    if (path.compare(0, root.size(), root) != 0) return false;
    return path.size() == root.size() || path[root.size()] == '/';
}

std::optional<std::string> relativePath(const std::string& anchor, const std::string& path) {
    if (!isUnder(path, anchor)) return std::nullopt;
    if (path.size() == anchor.size()) return std::string();
    std::size_t off = (anchor == "/") ? 1 : anchor.size() + 1;
    return path.substr(off);
}

bool globMatch(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string resolvePath(const std::string& wrkdir, const std::string& input) {
    if (input.empty()) return wrkdir;
    return normalizePath(input[0] == '/' ? input : joinPath(wrkdir, input));
}

} // namespace termxfer
