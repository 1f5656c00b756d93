// Temporary directory owned by the activity for remote open/edit/copy round trips.
// Removed by close() or, failing that, by the destructor.
#pragma once
#include <memory>
#include <string>

namespace termxfer {

class TempCache {
public:
    // Create a fresh directory under $TMPDIR (or /tmp). Returns nullptr and fills err on failure.
    static std::unique_ptr<TempCache> create(std::string& err);
    ~TempCache();

    TempCache(const TempCache&) = delete;
    TempCache& operator=(const TempCache&) = delete;

    const std::string& path() const { return path_; }
    bool isOpen() const { return !closed_; }
    // Unique path inside the cache for a file called name.
    std::string fileFor(const std::string& name);
    // Remove the directory and everything in it. Safe to call twice.
    bool close(std::string& err);

private:
    explicit TempCache(std::string path) : path_(std::move(path)) {}

    std::string path_;
    bool closed_ = false;
    unsigned counter_ = 0;
};

} // namespace termxfer
