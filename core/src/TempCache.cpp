#include "termxfer/TempCache.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtil.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace termxfer {

std::unique_ptr<TempCache> TempCache::create(std::string& err) {
    const char* tmp = std::getenv("TMPDIR");
    std::string tmpl = joinPath((tmp && *tmp) ? tmp : "/tmp", "termxfer-XXXXXX");
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        err = "Could not create temporary directory: " + std::string(std::strerror(errno));
        return nullptr;
    }
    return std::unique_ptr<TempCache>(new TempCache(buf.data()));
}

TempCache::~TempCache() {
    std::string err;
    if (!close(err)) LOGE("%s", err.c_str());
}

std::string TempCache::fileFor(const std::string& name) {
    const std::string dir = joinPath(path_, std::to_string(++counter_));
    std::error_code ec;
    std::filesystem::create_directory(dir, ec);
    if (ec) LOGW("cache: could not create %s: %s", dir.c_str(), ec.message().c_str());
    return joinPath(dir, name);
}

bool TempCache::close(std::string& err) {
    if (closed_) return true;
    closed_ = true;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        err = "Could not remove temporary directory " + path_ + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace termxfer
