// Local change watcher (inotify). A background thread collects and coalesces events;
// the tick thread drains them with the non-blocking poll().
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace termxfer {

enum class WatcherError { None, InitFailed, CapacityExceeded, AlreadyWatched, NotWatched, NotFound, WatchFailed };

const char* watcherErrorName(WatcherError e);

struct FsChange {
    enum class Kind { Created, Modified, Removed };
    Kind kind = Kind::Modified;
    std::string local;   // changed local path
    std::string remote;  // counterpart under the remote path mapped at watch time
};

const char* fsChangeKindName(FsChange::Kind k);

class FsWatcher {
public:
    static constexpr std::size_t kMaxQueuedEvents = 1024;

    // Start change detection for an empty set. Returns nullptr and fills err on failure.
    static std::unique_ptr<FsWatcher> init(std::chrono::milliseconds delay,
                                           std::size_t maxWatched,
                                           std::string& err);
    ~FsWatcher();

    FsWatcher(const FsWatcher&) = delete;
    FsWatcher& operator=(const FsWatcher&) = delete;

    // Watch a local file or directory tree; changes map to paths under remote.
    WatcherError watch(const std::string& local, const std::string& remote, std::string& err);
    WatcherError unwatch(const std::string& local, std::string& err);
    bool isWatched(const std::string& local) const;
    // Registered (local, remote) pairs, sorted by local path.
    std::vector<std::pair<std::string, std::string>> watchedPaths() const;
    std::size_t capacity() const { return maxWatched_; }

    // Non-blocking: move coalesced events into out. False with err when the producer
    // reported a failure since the previous call (events are still delivered).
    bool poll(std::vector<FsChange>& out, std::string& err);

    // Stop and join the background thread. Idempotent.
    void stop();

private:
    struct Pending {
        FsChange::Kind kind;
        std::chrono::steady_clock::time_point since;
    };

    FsWatcher(int fd, int wakeRead, int wakeWrite, std::chrono::milliseconds delay, std::size_t maxWatched);

    int fd_ = -1;
    int wakeRead_ = -1;
    int wakeWrite_ = -1;
    std::chrono::milliseconds delay_;
    std::size_t maxWatched_;

    mutable std::mutex mtx_;
    std::map<std::string, std::string> roots_;  // local root -> remote root
    std::map<int, std::string> wds_;            // watch descriptor -> local path
    std::map<std::string, Pending> pending_;    // local path -> coalesced change
    std::deque<FsChange> ready_;
    std::vector<std::string> errors_;

    std::atomic<bool> stopping_{false};
    std::thread worker_;

    void run();
    void readEvents();
    void flushDue(bool all);
    // Callers hold mtx_.
    bool addWatchTree(const std::string& path, std::string& err);
    void record(const std::string& path, FsChange::Kind kind);
    const std::string* rootOf(const std::string& path) const;
};

} // namespace termxfer
