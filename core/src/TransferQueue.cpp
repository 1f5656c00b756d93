// Queue implementation: one entry per step, lazy directory expansion, conflict decisions.
#include "termxfer/TransferQueue.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtil.hpp"
#include <algorithm>

namespace termxfer {

const char* transferStatusName(TransferStatus s) {
    switch (s) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::Conflict: return "conflict";
        case TransferStatus::Skipped: return "skipped";
        case TransferStatus::InProgress: return "in progress";
        case TransferStatus::Done: return "done";
        case TransferStatus::Failed: return "failed";
    }
    return "pending";
}

namespace {

bool isOpen(TransferStatus s) {
    return s == TransferStatus::Pending || s == TransferStatus::Conflict || s == TransferStatus::InProgress;
}

} // namespace

bool TransferQueue::hasWork() const {
    if (states_.aborted) return false;
    return std::any_of(entries_.begin(), entries_.end(),
                       [](const TransferEntry& e) { return isOpen(e.status); });
}

void TransferQueue::startRunIfIdle() {
    // An aborted run is over even if it was never stepped again
    if (running_ && !states_.aborted) return;
    if (states_.aborted || !hasWork()) {
        entries_.clear();
        states_ = TransferStates{};
        committedBytes_ = 0;
        paused_ = false;
    }
    running_ = true;
    states_.startedAt = std::chrono::steady_clock::now();
}

bool TransferQueue::destinationExists(const TransferEntry& e, RemoteClient* client,
                                      bool& exists, std::string& err) const {
    bool isDir = false;
    if (e.direction == TransferDirection::Download) {
        exists = local_.exists(e.dst, isDir);
        return true;
    }
    if (!client) {
        err = "Not connected";
        return false;
    }
    std::string xerr;
    exists = client->exists(e.dst, isDir, xerr);
    if (!exists && !xerr.empty()) {
        err = xerr;
        return false;
    }
    return true;
}

void TransferQueue::countEntry(const TransferEntry& e) {
    if (e.action != TransferEntry::Action::Transfer || e.isDir) return;
    states_.fileTotal += 1;
    states_.bytesTotal += e.sizeHint;
}

void TransferQueue::uncountEntry(const TransferEntry& e) {
    if (e.action != TransferEntry::Action::Transfer || e.isDir) return;
    if (states_.fileTotal > 0) states_.fileTotal -= 1;
    states_.bytesTotal -= std::min(states_.bytesTotal, e.sizeHint);
    states_.bytesDone = std::min(states_.bytesDone, states_.bytesTotal);
}

void TransferQueue::skip(TransferEntry& e) {
    e.status = TransferStatus::Skipped;
    uncountEntry(e);
}

bool TransferQueue::enqueue(const std::vector<FileEntry>& selection,
                            TransferDirection direction,
                            const std::string& destDir,
                            RemoteClient* client,
                            std::string& err,
                            const std::optional<std::string>& newName) {
    std::vector<TransferEntry> batch;
    batch.reserve(selection.size());
    for (const auto& f : selection) {
        TransferEntry t;
        t.direction = direction;
        t.src = f.path;
        const std::string name = (newName && selection.size() == 1) ? *newName : f.name;
        t.dst = joinPath(destDir, name);
        t.isDir = f.isDir();
        t.sizeHint = t.isDir ? 0 : f.size;
        bool exists = false;
        if (!destinationExists(t, client, exists, err)) return false;
        if (exists) t.status = TransferStatus::Conflict;
        batch.push_back(std::move(t));
    }

    startRunIfIdle();
    for (auto& t : batch) {
        t.id = nextId_++;
        countEntry(t);
        LOGD("queued #%llu %s -> %s (%s)", (unsigned long long)t.id, t.src.c_str(), t.dst.c_str(),
             transferStatusName(t.status));
        entries_.push_back(std::move(t));
    }
    notify();
    return true;
}

bool TransferQueue::enqueuePath(const std::string& src,
                                const std::string& dst,
                                TransferDirection direction,
                                bool replace,
                                RemoteClient* client,
                                std::string& err) {
    FileEntry info;
    std::string serr;
    bool found = false;
    if (direction == TransferDirection::Upload) {
        found = local_.stat(src, info, serr);
    } else if (client) {
        found = client->stat(src, info, serr);
    } else {
        serr = "Not connected";
    }
    if (!found) {
        err = serr.empty() ? "No such file: " + src : serr;
        return false;
    }

    TransferEntry t;
    t.direction = direction;
    t.src = src;
    t.dst = dst;
    t.isDir = info.isDir();
    t.sizeHint = t.isDir ? 0 : info.size;
    bool exists = false;
    if (!destinationExists(t, client, exists, err)) return false;
    if (exists) {
        if (replace) t.replace = true;
        else t.status = TransferStatus::Conflict;
    }

    startRunIfIdle();
    t.id = nextId_++;
    countEntry(t);
    entries_.push_back(std::move(t));
    notify();
    return true;
}

void TransferQueue::enqueueRemove(const std::string& dst, TransferDirection direction) {
    startRunIfIdle();
    TransferEntry t;
    t.id = nextId_++;
    t.action = TransferEntry::Action::Remove;
    t.direction = direction;
    t.dst = dst;
    entries_.push_back(std::move(t));
    notify();
}

const TransferEntry* TransferQueue::firstConflict() const {
    for (const auto& e : entries_) {
        if (e.status == TransferStatus::Conflict) return &e;
    }
    return nullptr;
}

std::vector<const TransferEntry*> TransferQueue::conflicts() const {
    std::vector<const TransferEntry*> out;
    for (const auto& e : entries_) {
        if (e.status == TransferStatus::Conflict) out.push_back(&e);
    }
    return out;
}

void TransferQueue::resolve(ConflictDecision decision) {
    auto first = std::find_if(entries_.begin(), entries_.end(),
                              [](const TransferEntry& e) { return e.status == TransferStatus::Conflict; });
    switch (decision) {
        case ConflictDecision::ReplaceThis:
            if (first != entries_.end()) {
                first->status = TransferStatus::Pending;
                first->replace = true;
            }
            break;
        case ConflictDecision::SkipThis:
            if (first != entries_.end()) skip(*first);
            break;
        // *All decisions cover the conflicts queued so far; later entries are checked on their own
        case ConflictDecision::ReplaceAll:
            for (auto& e : entries_) {
                if (e.status != TransferStatus::Conflict) continue;
                e.status = TransferStatus::Pending;
                e.replace = true;
            }
            break;
        case ConflictDecision::SkipAll:
            for (auto& e : entries_) {
                if (e.status == TransferStatus::Conflict) skip(e);
            }
            break;
        case ConflictDecision::Abort:
            // Nothing is in flight while a decision is pending, so the run ends now
            abort();
            running_ = false;
            break;
    }
    notify();
}

void TransferQueue::abort() {
    if (!states_.aborted) LOGI("transfer queue: abort requested");
    states_.aborted = true;
}

void TransferQueue::notify() {
    if (progressHook_) progressHook_(states_);
}

TransferQueue::StepResult TransferQueue::step(RemoteClient* client, std::string& err) {
    err.clear();
    if (!running_) return StepResult::Idle;
    if (states_.aborted) {
        running_ = false;
        states_.activeEntry.reset();
        return StepResult::Aborted;
    }
    if (paused_) {
        if (!client || !client->isConnected()) return StepResult::ConnectionLost;
        paused_ = false;
        LOGI("transfer queue: connection is back, resuming");
    }

    auto it = std::find_if(entries_.begin(), entries_.end(), [](const TransferEntry& e) {
        return e.status == TransferStatus::Pending || e.status == TransferStatus::Conflict;
    });
    if (it == entries_.end()) {
        running_ = false;
        states_.activeEntry.reset();
        const auto secs = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - states_.startedAt).count() / 1000.0;
        LOGI("transfer queue finished: %zu files, %llu bytes in %.1fs", states_.fileDone,
             (unsigned long long)states_.bytesDone, secs);
        return StepResult::Finished;
    }
    const std::size_t index = static_cast<std::size_t>(it - entries_.begin());

    if (it->status == TransferStatus::Conflict) return StepResult::AwaitingDecision;

    if (!client || !client->isConnected()) {
        paused_ = true;
        return StepResult::ConnectionLost;
    }

    it->status = TransferStatus::InProgress;
    states_.activeEntry = it->id;
    notify();

    bool ok = false;
    if (it->action == TransferEntry::Action::Remove) {
        ok = runRemove(*it, *client, err);
    } else if (it->isDir) {
        ok = runDirectory(index, *client, err);
    } else {
        ok = runFile(*it, *client, err);
    }

    // runDirectory may have grown the vector
    TransferEntry& cur = entries_[index];
    states_.activeEntry.reset();
    if (ok) {
        cur.status = TransferStatus::Done;
        cur.resumeHint = false;
        cur.error.clear();
        notify();
        return StepResult::Progressed;
    }

    states_.bytesDone = committedBytes_;
    if (states_.aborted) {
        // Partial file stays where it is; a retry resumes it
        cur.status = TransferStatus::Failed;
        cur.error = "aborted";
        cur.resumeHint = true;
        uncountEntry(cur);
        running_ = false;
        notify();
        return StepResult::Aborted;
    }
    if (!client->isConnected()) {
        cur.status = TransferStatus::Pending;
        cur.resumeHint = true;
        paused_ = true;
        LOGW("transfer queue paused, connection lost during %s: %s", cur.src.c_str(), err.c_str());
        notify();
        return StepResult::ConnectionLost;
    }
    cur.status = TransferStatus::Failed;
    cur.error = err;
    uncountEntry(cur);
    LOGE("transfer failed %s -> %s: %s", cur.src.c_str(), cur.dst.c_str(), err.c_str());
    notify();
    return StepResult::Progressed;
}

TransferQueue::StepResult TransferQueue::execute(RemoteClient* client, std::string& err) {
    err.clear();
    for (;;) {
        std::string e;
        StepResult r = step(client, e);
        if (!e.empty()) err = e;
        if (r != StepResult::Progressed) return r;
    }
}

bool TransferQueue::runFile(TransferEntry& e, RemoteClient& client, std::string& err) {
    states_.fileName = baseName(e.src);
    states_.fileBytesTotal = e.sizeHint;
    states_.fileBytesDone = 0;

    auto progress = [this, &e](std::size_t done, std::size_t total) {
        if (total != e.sizeHint) {
            // Source changed since it was listed
            states_.bytesTotal = states_.bytesTotal - std::min(states_.bytesTotal, e.sizeHint) + total;
            e.sizeHint = total;
            states_.fileBytesTotal = total;
        }
        states_.fileBytesDone = std::min<std::uint64_t>(done, total);
        states_.bytesDone = committedBytes_ + states_.fileBytesDone;
        notify();
    };
    auto shouldCancel = [this]() { return states_.aborted; };

    bool ok = false;
    if (e.direction == TransferDirection::Upload) {
        ok = client.put(e.src, e.dst, err, progress, shouldCancel, e.resumeHint);
    } else {
        const std::string parent = parentPath(e.dst);
        bool isDir = false;
        if (!local_.exists(parent, isDir) && !local_.mkdirs(parent, err)) return false;
        ok = client.get(e.src, e.dst, err, progress, shouldCancel, e.resumeHint);
    }
    if (!ok) return false;

    committedBytes_ += e.sizeHint;
    states_.fileDone += 1;
    states_.fileBytesDone = states_.fileBytesTotal;
    states_.bytesDone = committedBytes_;
    return true;
}

bool TransferQueue::runDirectory(std::size_t index, RemoteClient& client, std::string& err) {
    const TransferEntry dir = entries_[index];
    bool exists = false;
    bool isDir = false;

    if (dir.direction == TransferDirection::Upload) {
        std::string xerr;
        exists = client.exists(dir.dst, isDir, xerr);
        if (!exists && !xerr.empty()) {
            err = xerr;
            return false;
        }
        if (!exists && !client.mkdir(dir.dst, err)) return false;
    } else {
        exists = local_.exists(dir.dst, isDir);
        if (!exists && !local_.mkdirs(dir.dst, err)) return false;
    }
    if (exists && !isDir) {
        err = "Destination exists and is not a directory: " + dir.dst;
        return false;
    }

    std::vector<FileEntry> children;
    const bool listed = dir.direction == TransferDirection::Upload
                            ? local_.list(dir.src, children, err)
                            : client.list(dir.src, children, err);
    if (!listed) return false;
    std::sort(children.begin(), children.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; });

    // A merged directory replaces its children; a new one cannot conflict
    std::vector<TransferEntry> batch;
    for (const auto& c : children) {
        if (c.kind == FileKind::Symlink && c.symlink_to_dir) {
            LOGW("skipping symlinked directory %s", c.path.c_str());
            continue;
        }
        TransferEntry t;
        t.id = nextId_++;
        t.direction = dir.direction;
        t.src = c.path;
        t.dst = joinPath(dir.dst, c.name);
        t.isDir = c.isDir();
        t.sizeHint = t.isDir ? 0 : c.size;
        t.replace = exists;
        countEntry(t);
        batch.push_back(std::move(t));
    }
    entries_.insert(entries_.begin() + static_cast<long>(index) + 1, batch.begin(), batch.end());
    return true;
}

bool TransferQueue::runRemove(TransferEntry& e, RemoteClient& client, std::string& err) {
    if (e.direction == TransferDirection::Download) {
        bool isDir = false;
        if (!local_.exists(e.dst, isDir)) return true;
        return local_.remove(e.dst, err);
    }
    FileEntry info;
    std::string serr;
    if (!client.stat(e.dst, info, serr)) {
        if (serr.empty()) return true; // already gone
        err = serr;
        return false;
    }
    return removeRemoteRecursive(client, info, err);
}

void TransferQueue::retryFailed() {
    bool any = false;
    for (auto& e : entries_) {
        if (e.status != TransferStatus::Failed) continue;
        e.status = TransferStatus::Pending;
        e.error.clear();
        countEntry(e);
        any = true;
    }
    const bool pending = std::any_of(entries_.begin(), entries_.end(),
                                     [](const TransferEntry& e) { return isOpen(e.status); });
    if (any || (states_.aborted && pending)) {
        states_.aborted = false;
        running_ = true;
        paused_ = false;
    }
    notify();
}

void TransferQueue::clearFinished() {
    if (running_) return;
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const TransferEntry& e) { return !isOpen(e.status); }),
                   entries_.end());
    notify();
}

void TransferQueue::clear() {
    entries_.clear();
    states_ = TransferStates{};
    committedBytes_ = 0;
    paused_ = false;
    running_ = false;
}

} // namespace termxfer
