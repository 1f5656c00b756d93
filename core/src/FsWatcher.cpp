// inotify watcher: recursive watches, per-path coalescing over the delay, bounded hand-off queue.
#include "termxfer/FsWatcher.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtil.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace termxfer {

const char* watcherErrorName(WatcherError e) {
    switch (e) {
        case WatcherError::None: return "none";
        case WatcherError::InitFailed: return "init failed";
        case WatcherError::CapacityExceeded: return "capacity exceeded";
        case WatcherError::AlreadyWatched: return "already watched";
        case WatcherError::NotWatched: return "not watched";
        case WatcherError::NotFound: return "not found";
        case WatcherError::WatchFailed: return "watch failed";
    }
    return "?";
}

const char* fsChangeKindName(FsChange::Kind k) {
    switch (k) {
        case FsChange::Kind::Created: return "created";
        case FsChange::Kind::Modified: return "modified";
        case FsChange::Kind::Removed: return "removed";
    }
    return "?";
}

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_DONT_FOLLOW;

} // namespace

std::unique_ptr<FsWatcher> FsWatcher::init(std::chrono::milliseconds delay,
                                           std::size_t maxWatched,
                                           std::string& err) {
    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        err = std::string("inotify_init1: ") + std::strerror(errno);
        return nullptr;
    }
    int wake[2];
    if (::pipe2(wake, O_NONBLOCK | O_CLOEXEC) != 0) {
        err = std::string("pipe2: ") + std::strerror(errno);
        ::close(fd);
        return nullptr;
    }
    std::unique_ptr<FsWatcher> w(new FsWatcher(fd, wake[0], wake[1], delay, maxWatched));
    w->worker_ = std::thread(&FsWatcher::run, w.get());
    LOGI("watcher started (delay %lldms, max %zu paths)", (long long)delay.count(), maxWatched);
    return w;
}

FsWatcher::FsWatcher(int fd, int wakeRead, int wakeWrite, std::chrono::milliseconds delay, std::size_t maxWatched)
    : fd_(fd), wakeRead_(wakeRead), wakeWrite_(wakeWrite), delay_(delay), maxWatched_(maxWatched) {}

FsWatcher::~FsWatcher() {
    stop();
}

void FsWatcher::stop() {
    stopping_ = true;
    if (worker_.joinable()) {
        const char b = 1;
        if (::write(wakeWrite_, &b, 1) < 0 && errno != EAGAIN) {
            LOGW("watcher wake-up failed: %s", std::strerror(errno));
        }
        worker_.join();
    }
    std::lock_guard<std::mutex> lk(mtx_);
    for (int fd : {fd_, wakeRead_, wakeWrite_}) {
        if (fd >= 0) ::close(fd);
    }
    fd_ = wakeRead_ = wakeWrite_ = -1;
    wds_.clear();
}

const std::string* FsWatcher::rootOf(const std::string& path) const {
    const std::string* best = nullptr;
    for (const auto& kv : roots_) {
        if (isUnder(path, kv.first) && (!best || kv.first.size() > best->size())) best = &kv.first;
    }
    return best;
}

bool FsWatcher::addWatchTree(const std::string& path, std::string& err) {
    auto add = [this, &err](const std::string& p) {
        int wd = ::inotify_add_watch(fd_, p.c_str(), kWatchMask);
        if (wd < 0) {
            err = "inotify_add_watch " + p + ": " + std::strerror(errno);
            return false;
        }
        wds_[wd] = p;
        return true;
    };
    if (!add(path)) return false;

    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(path, ec))) return true;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_symlink(ec)) continue;
        if (it->is_directory(ec) && !add(it->path().string())) return false;
    }
    if (ec) {
        err = "Could not scan " + path + ": " + ec.message();
        return false;
    }
    return true;
}

WatcherError FsWatcher::watch(const std::string& local, const std::string& remote, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (fd_ < 0) {
        err = "watcher is stopped";
        return WatcherError::InitFailed;
    }
    if (roots_.count(local)) {
        err = local + " is already watched";
        return WatcherError::AlreadyWatched;
    }
    if (roots_.size() >= maxWatched_) {
        err = "Cannot watch more than " + std::to_string(maxWatched_) + " paths";
        return WatcherError::CapacityExceeded;
    }
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(local, ec))) {
        err = "No such file or directory: " + local;
        return WatcherError::NotFound;
    }
    const auto before = wds_;
    if (!addWatchTree(local, err)) {
        for (const auto& kv : wds_) {
            if (!before.count(kv.first)) ::inotify_rm_watch(fd_, kv.first);
        }
        wds_ = before;
        return WatcherError::WatchFailed;
    }
    roots_[local] = remote;
    LOGI("watching %s -> %s", local.c_str(), remote.c_str());
    return WatcherError::None;
}

WatcherError FsWatcher::unwatch(const std::string& local, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = roots_.find(local);
    if (it == roots_.end()) {
        err = local + " is not watched";
        return WatcherError::NotWatched;
    }
    roots_.erase(it);
    for (auto w = wds_.begin(); w != wds_.end();) {
        if (isUnder(w->second, local) && !rootOf(w->second)) {
            if (fd_ >= 0) ::inotify_rm_watch(fd_, w->first);
            w = wds_.erase(w);
        } else {
            ++w;
        }
    }
    for (auto p = pending_.begin(); p != pending_.end();) {
        if (!rootOf(p->first)) p = pending_.erase(p);
        else ++p;
    }
    LOGI("unwatched %s", local.c_str());
    return WatcherError::None;
}

bool FsWatcher::isWatched(const std::string& local) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return roots_.count(local) != 0;
}

std::vector<std::pair<std::string, std::string>> FsWatcher::watchedPaths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<std::pair<std::string, std::string>>(roots_.begin(), roots_.end());
}

bool FsWatcher::poll(std::vector<FsChange>& out, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    while (!ready_.empty()) {
        out.push_back(std::move(ready_.front()));
        ready_.pop_front();
    }
    if (errors_.empty()) return true;
    err.clear();
    for (const auto& e : errors_) {
        if (!err.empty()) err += "; ";
        err += e;
    }
    errors_.clear();
    return false;
}

void FsWatcher::run() {
    const int timeout = static_cast<int>(std::max<long long>(10, delay_.count() / 2));
    while (!stopping_) {
        struct pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeRead_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;
        int rc = ::poll(fds, 2, timeout);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::lock_guard<std::mutex> lk(mtx_);
            errors_.push_back(std::string("watcher poll failed: ") + std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (fds[0].revents & POLLIN) readEvents();
        flushDue(false);
    }
    flushDue(true);
}

void FsWatcher::readEvents() {
    alignas(struct inotify_event) char buf[16384];
    for (;;) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) return;
            std::lock_guard<std::mutex> lk(mtx_);
            errors_.push_back(std::string("watcher read failed: ") + std::strerror(errno));
            return;
        }
        if (n == 0) return;

        std::lock_guard<std::mutex> lk(mtx_);
        for (char* p = buf; p < buf + n;) {
            auto* ev = reinterpret_cast<struct inotify_event*>(p);
            p += sizeof(struct inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                errors_.push_back("inotify queue overflow, some changes were lost");
                continue;
            }
            auto wd = wds_.find(ev->wd);
            if (ev->mask & IN_IGNORED) {
                if (wd != wds_.end()) wds_.erase(wd);
                continue;
            }
            if (wd == wds_.end()) continue;
            const std::string path = ev->len ? joinPath(wd->second, ev->name) : wd->second;
            if (!rootOf(path)) continue;

            const bool isDir = (ev->mask & IN_ISDIR) != 0;
            if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
                record(path, FsChange::Kind::Created);
                std::string werr;
                if (isDir && !addWatchTree(path, werr)) errors_.push_back(werr);
            } else if (ev->mask & (IN_DELETE | IN_MOVED_FROM)) {
                record(path, FsChange::Kind::Removed);
            } else if ((ev->mask & (IN_MODIFY | IN_CLOSE_WRITE)) && !isDir) {
                record(path, FsChange::Kind::Modified);
            }
        }
    }
}

void FsWatcher::record(const std::string& path, FsChange::Kind kind) {
    // A pending creation of an ancestor already carries this path
    for (const auto& kv : pending_) {
        if (kv.second.kind == FsChange::Kind::Created && kv.first != path && isUnder(path, kv.first)) return;
    }
    auto it = pending_.find(path);
    if (it == pending_.end()) {
        pending_[path] = Pending{kind, std::chrono::steady_clock::now()};
        return;
    }
    FsChange::Kind& prev = it->second.kind;
    if (prev == FsChange::Kind::Created && kind == FsChange::Kind::Removed) {
        pending_.erase(it);
    } else if (prev == FsChange::Kind::Created) {
        // modified after created stays created
    } else if (prev == FsChange::Kind::Removed && kind == FsChange::Kind::Created) {
        prev = FsChange::Kind::Modified;
    } else {
        prev = kind;
    }
}

void FsWatcher::flushDue(bool all) {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::chrono::steady_clock::time_point, FsChange>> due;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (!all && now - it->second.since < delay_) {
            ++it;
            continue;
        }
        FsChange c;
        c.kind = it->second.kind;
        c.local = it->first;
        if (const std::string* root = rootOf(it->first)) {
            auto rel = relativePath(*root, it->first);
            const std::string& remoteRoot = roots_.at(*root);
            c.remote = (rel && !rel->empty()) ? joinPath(remoteRoot, *rel) : remoteRoot;
        }
        due.emplace_back(it->second.since, std::move(c));
        it = pending_.erase(it);
    }
    // Hand over in arrival order
    std::stable_sort(due.begin(), due.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    std::size_t dropped = 0;
    for (auto& d : due) {
        if (ready_.size() >= kMaxQueuedEvents) {
            ++dropped;
            continue;
        }
        ready_.push_back(std::move(d.second));
    }
    if (dropped) errors_.push_back("watcher event queue full, " + std::to_string(dropped) + " changes dropped");
}

} // namespace termxfer
