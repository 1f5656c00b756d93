// File transfer activity actions: navigation, synchronized browsing and file operations
// on either side.
#include "termxfer/FileTransferActivity.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtil.hpp"
#include <cstdlib>
#include <sstream>

namespace termxfer {

bool FileTransferActivity::listDir(Side side, const std::string& dir, std::vector<FileEntry>& out, std::string& err) {
    if (side == Side::Local) return host_.list(dir, out, err);
    RemoteClient* rc = client();
    if (!rc) {
        err = "Not connected";
        return false;
    }
    return rc->list(dir, out, err);
}

bool FileTransferActivity::changeDir(Side side, const std::string& dir, bool pushHistory, bool mirror) {
    const std::string target = normalizePath(dir);
    std::vector<FileEntry> files;
    std::string err;
    if (!listDir(side, target, files, err)) {
        // The pane keeps its previous directory and listing
        const std::string msg = "Could not change working directory to " + target + ": " + err;
        if (side == Side::Remote) {
            remoteError(msg);
        } else {
            logError(msg);
            mountError(msg);
        }
        return false;
    }
    FileExplorer& ex = browser_.explorer(side);
    const std::string previous = ex.wrkdir();
    if (pushHistory && !previous.empty() && previous != target) ex.pushHistory(previous);
    ex.setWrkdir(target);
    if (previous != target) ex.clearMarks();
    ex.setFiles(std::move(files));
    if (previous != target) ex.setCursor(0);
    LOGD("%s working directory: %s", sideName(side), target.c_str());
    redraw_ = true;

    if (mirror && browser_.syncBrowsing()) syncTo(otherSide(side), target);
    return true;
}

void FileTransferActivity::reloadDir(Side side) {
    FileExplorer& ex = browser_.explorer(side);
    if (ex.wrkdir().empty()) return;
    if (side == Side::Remote && !client()) return;
    std::vector<FileEntry> files;
    std::string err;
    if (!listDir(side, ex.wrkdir(), files, err)) {
        // Previous listing stays on screen
        logWarn("Could not reload " + ex.wrkdir() + ": " + err);
        if (side == Side::Remote && conn_.noteConnectionLost()) logWarn("Connection lost");
        return;
    }
    ex.setFiles(std::move(files));
    redraw_ = true;
}

void FileTransferActivity::reloadBoth() {
    reloadDir(Side::Local);
    reloadDir(Side::Remote);
}

void FileTransferActivity::syncTo(Side target, const std::string& sourceDir) {
    const auto mirrored = browser_.mirrorPath(otherSide(target), sourceDir);
    if (!mirrored) {
        logWarn(sourceDir + " is outside the synchronized root, " + sideName(target) + " pane not changed");
        return;
    }
    if (*mirrored == browser_.explorer(target).wrkdir()) return;

    bool isDir = false;
    bool exists = false;
    if (target == Side::Local) {
        exists = host_.exists(*mirrored, isDir);
    } else {
        RemoteClient* rc = client();
        if (!rc) {
            logWarn("Not connected, remote pane not synchronized");
            return;
        }
        std::string err;
        exists = rc->exists(*mirrored, isDir, err);
        if (!exists && !err.empty()) {
            remoteError("Could not check " + *mirrored + ": " + err);
            return;
        }
    }
    if (exists && isDir) {
        changeDir(target, *mirrored, true, false);
        return;
    }
    if (exists) {
        logError("Cannot synchronize: " + *mirrored + " is not a directory");
        return;
    }

    PendingAction action;
    action.chain = pending_.newChain();
    action.kind = PendingAction::Kind::MakeDirectoryThen;
    action.then = PendingAction::Then::EnterDirectory;
    action.side = target;
    action.path = *mirrored;
    pending_.push(action);
    mountConfirm(Id::SyncBrowsingMkdirPopup, "Synchronized browsing",
                 "Directory " + *mirrored + " does not exist on the " + sideName(target) +
                     " side. Create it?",
                 action.chain);
}

void FileTransferActivity::toggleSyncBrowsing() {
    if (browser_.syncBrowsing()) {
        browser_.setSyncBrowsing(false);
        logInfo("Synchronized browsing disabled");
        return;
    }
    if (!client() || browser_.remote().wrkdir().empty()) {
        const std::string msg = "Synchronized browsing needs an established connection";
        logError(msg);
        mountError(msg);
        return;
    }
    if (!browser_.anchor(Side::Local) || !browser_.anchor(Side::Remote)) {
        browser_.setAnchors(browser_.local().wrkdir(), browser_.remote().wrkdir());
    }
    browser_.setSyncBrowsing(true);
    logInfo("Synchronized browsing enabled");

    const auto localRel = relativePath(*browser_.anchor(Side::Local), browser_.local().wrkdir());
    const auto remoteRel = relativePath(*browser_.anchor(Side::Remote), browser_.remote().wrkdir());
    if (localRel && remoteRel && *localRel == *remoteRel) return;
    syncTo(Side::Remote, browser_.local().wrkdir());
}

std::vector<FileEntry> FileTransferActivity::currentSelection() {
    return browser_.focused().selection();
}

std::optional<Msg> FileTransferActivity::transferSelection(const std::vector<FileEntry>& selection,
                                                           const std::optional<std::string>& newName) {
    if (selection.empty()) return std::nullopt;
    RemoteClient* rc = client();
    if (!rc) {
        const std::string msg = "Not connected, cannot transfer";
        logError(msg);
        mountError(msg);
        return std::nullopt;
    }
    const Side side = browser_.side();
    const TransferDirection direction = side == Side::Local ? TransferDirection::Upload : TransferDirection::Download;
    std::string destDir = browser_.explorer(otherSide(side)).wrkdir();
    std::optional<std::string> name = newName;
    if (newName && newName->find('/') != std::string::npos) {
        const std::string full = resolvePath(destDir, *newName);
        destDir = parentPath(full);
        name = baseName(full);
    }
    std::string err;
    if (!queue_.enqueue(selection, direction, destDir, rc, err, name)) {
        remoteError("Could not queue transfer: " + err);
        return std::nullopt;
    }
    logInfo("Queued " + std::to_string(selection.size()) + " entries for " +
            (direction == TransferDirection::Upload ? "upload" : "download") + " to " + destDir);
    browser_.focused().clearMarks();
    return startQueue();
}

std::optional<Msg> FileTransferActivity::startQueue() {
    if (queue_.firstConflict() && !queue_.isAborted()) {
        mountReplacePopup();
        bool waiting = false;
        for (const auto& a : pending_.actions()) {
            if (a.kind == PendingAction::Kind::AwaitConflictResolutionThen) waiting = true;
        }
        if (!waiting) {
            PendingAction action;
            action.chain = pending_.newChain();
            action.kind = PendingAction::Kind::AwaitConflictResolutionThen;
            action.then = PendingAction::Then::ExecuteQueue;
            pending_.push(action);
        }
        return std::nullopt;
    }
    if (executing_) return std::nullopt;
    return PendingActionMsg{PendingActionMsg::Kind::TransferPendingFile, 0};
}

void FileTransferActivity::actionEnterDirectory() {
    const Side side = browser_.side();
    const FileEntry* cursor = browser_.focused().cursorEntry();
    if (!cursor) return;
    const FileEntry entry = *cursor;
    if (browser_.inFindMode()) {
        browser_.clearFound();
        if (entry.isDir()) {
            changeDir(side, entry.path, true);
        } else if (changeDir(side, parentPath(entry.path), true)) {
            FileExplorer& ex = browser_.explorer(side);
            // Found entries are named relative to the search root
            if (auto idx = ex.indexOf(baseName(entry.path))) ex.setCursor(*idx);
        }
        return;
    }
    if (entry.isDir()) changeDir(side, entry.path, true);
}

void FileTransferActivity::actionGoToPrevious() {
    const Side side = browser_.side();
    if (auto prev = browser_.explorer(side).popHistory()) changeDir(side, *prev, false);
}

void FileTransferActivity::actionCopy(const std::string& dest) {
    if (dest.empty()) return;
    const Side side = browser_.side();
    const auto selection = currentSelection();
    const std::string target = resolvePath(browser_.explorer(side).wrkdir(), dest);
    for (const auto& e : selection) {
        std::string to = target;
        std::string err;
        bool isDir = false;
        if (side == Side::Local) {
            if (selection.size() > 1 || (host_.exists(target, isDir) && isDir)) to = joinPath(target, e.name);
            if (!host_.copy(e.path, to, err)) {
                const std::string msg = "Could not copy " + e.path + " to " + to + ": " + err;
                logError(msg);
                mountError(msg);
                continue;
            }
        } else {
            RemoteClient* rc = client();
            if (!rc) {
                remoteError("Not connected");
                return;
            }
            std::string xerr;
            if (selection.size() > 1 || (rc->exists(target, isDir, xerr) && isDir)) to = joinPath(target, e.name);
            if (!remoteCopy(e, to, err)) {
                remoteError("Could not copy " + e.path + " to " + to + ": " + err);
                continue;
            }
        }
        logInfo("Copied " + e.path + " to " + to);
    }
    reloadDir(side);
}

bool FileTransferActivity::remoteCopy(const FileEntry& src, const std::string& dst, std::string& err) {
    RemoteClient* rc = client();
    if (!rc) {
        err = "Not connected";
        return false;
    }
    std::string output;
    std::string xerr;
    if (rc->exec("cp -rp -- " + shellQuote(src.path) + " " + shellQuote(dst), output, xerr)) return true;
    LOGD("remote cp failed (%s), copying through the cache", xerr.c_str());

    if (src.isDir() && src.kind != FileKind::Symlink) {
        if (!rc->mkdir(dst, err)) return false;
        std::vector<FileEntry> children;
        if (!rc->list(src.path, children, err)) return false;
        for (const auto& c : children) {
            if (!remoteCopy(c, joinPath(dst, c.name), err)) return false;
        }
        return true;
    }
    std::string local;
    if (!downloadToCache(src, local, err)) return false;
    return rc->put(local, dst, err);
}

bool FileTransferActivity::downloadToCache(const FileEntry& entry, std::string& localPath, std::string& err) {
    if (!cache_) {
        err = "No temporary cache available";
        return false;
    }
    RemoteClient* rc = client();
    if (!rc) {
        err = "Not connected";
        return false;
    }
    localPath = cache_->fileFor(entry.name);
    return rc->get(entry.path, localPath, err);
}

void FileTransferActivity::actionSymlink(const std::string& name) {
    if (name.empty()) return;
    const Side side = browser_.side();
    const FileEntry* e = browser_.focused().cursorEntry();
    if (!e) return;
    const std::string link = resolvePath(browser_.explorer(side).wrkdir(), name);
    std::string err;
    if (side == Side::Local) {
        if (!host_.symlink(e->path, link, err)) {
            logError("Could not create symlink " + link + ": " + err);
            mountError(err);
            return;
        }
    } else {
        RemoteClient* rc = client();
        if (!rc || !rc->symlink(e->path, link, err)) {
            remoteError("Could not create symlink " + link + ": " + (rc ? err : std::string("not connected")));
            return;
        }
    }
    logInfo("Created symlink " + link + " -> " + e->path);
    reloadDir(side);
}

void FileTransferActivity::actionDelete() {
    const Side side = browser_.side();
    const auto selection = currentSelection();
    for (const auto& e : selection) {
        std::string err;
        if (side == Side::Local) {
            if (!host_.remove(e.path, err)) {
                const std::string msg = "Could not delete " + e.path + ": " + err;
                logError(msg);
                mountError(msg);
                continue;
            }
        } else {
            RemoteClient* rc = client();
            if (!rc) {
                remoteError("Not connected");
                break;
            }
            if (!removeRemoteRecursive(*rc, e, err)) {
                remoteError("Could not delete " + e.path + ": " + err);
                continue;
            }
        }
        logInfo("Removed " + e.path);
    }
    if (browser_.inFindMode()) browser_.clearFound();
    reloadDir(side);
}

void FileTransferActivity::actionMkdir(const std::string& name) {
    if (name.empty()) return;
    const Side side = browser_.side();
    const std::string path = resolvePath(browser_.explorer(side).wrkdir(), name);
    std::string err;
    if (side == Side::Local) {
        if (!host_.mkdir(path, err)) {
            const std::string msg = "Could not create directory " + path + ": " + err;
            logError(msg);
            mountError(msg);
            return;
        }
    } else {
        RemoteClient* rc = client();
        if (!rc || !rc->mkdir(path, err)) {
            remoteError("Could not create directory " + path + ": " + (rc ? err : std::string("not connected")));
            return;
        }
    }
    logInfo("Created directory " + path);
    reloadDir(side);
}

void FileTransferActivity::actionNewFile(const std::string& name) {
    if (name.empty()) return;
    const Side side = browser_.side();
    const std::string path = resolvePath(browser_.explorer(side).wrkdir(), name);
    std::string err;
    if (side == Side::Local) {
        if (!host_.touch(path, err)) {
            const std::string msg = "Could not create file " + path + ": " + err;
            logError(msg);
            mountError(msg);
            return;
        }
    } else {
        RemoteClient* rc = client();
        if (!rc) {
            remoteError("Not connected");
            return;
        }
        bool isDir = false;
        if (rc->exists(path, isDir, err)) {
            const std::string msg = "File " + path + " already exists";
            logError(msg);
            mountError(msg);
            return;
        }
        if (!err.empty()) {
            remoteError("Could not create file " + path + ": " + err);
            return;
        }
        if (!cache_) {
            logError("No temporary cache available");
            return;
        }
        const std::string local = cache_->fileFor(baseName(path));
        if (!host_.touch(local, err) || !rc->put(local, path, err)) {
            remoteError("Could not create file " + path + ": " + err);
            return;
        }
    }
    logInfo("Created file " + path);
    reloadDir(side);
}

void FileTransferActivity::actionRename(const std::string& dest) {
    if (dest.empty()) return;
    const Side side = browser_.side();
    const auto selection = currentSelection();
    const std::string target = resolvePath(browser_.explorer(side).wrkdir(), dest);
    for (const auto& e : selection) {
        std::string to = target;
        std::string err;
        bool isDir = false;
        if (side == Side::Local) {
            if (selection.size() > 1 || (host_.exists(target, isDir) && isDir)) to = joinPath(target, e.name);
            if (!host_.rename(e.path, to, err)) {
                const std::string msg = "Could not move " + e.path + " to " + to + ": " + err;
                logError(msg);
                mountError(msg);
                continue;
            }
        } else {
            RemoteClient* rc = client();
            if (!rc) {
                remoteError("Not connected");
                return;
            }
            std::string xerr;
            if (selection.size() > 1 || (rc->exists(target, isDir, xerr) && isDir)) to = joinPath(target, e.name);
            if (!rc->rename(e.path, to, err)) {
                remoteError("Could not move " + e.path + " to " + to + ": " + err);
                continue;
            }
        }
        logInfo("Moved " + e.path + " to " + to);
    }
    if (browser_.inFindMode()) browser_.clearFound();
    reloadDir(side);
}

void FileTransferActivity::actionExec(const std::string& cmd) {
    if (cmd.empty()) return;
    const Side side = browser_.side();
    const std::string& wrkdir = browser_.explorer(side).wrkdir();
    std::string output;
    std::string err;
    if (side == Side::Local) {
        if (!host_.exec(wrkdir, cmd, output, err)) {
            logError("Could not execute \"" + cmd + "\": " + err);
            mountError(err + (output.empty() ? std::string() : "\n" + output));
            return;
        }
    } else {
        RemoteClient* rc = client();
        if (!rc || !rc->exec("cd " + shellQuote(wrkdir) + " && " + cmd, output, err)) {
            remoteError("Could not execute \"" + cmd + "\": " + (rc ? err : std::string("not connected")));
            return;
        }
    }
    logInfo("\"" + cmd + "\" (exitcode: 0)");
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) logInfo(line);
    }
    reloadDir(side);
}

void FileTransferActivity::actionOpen(const std::optional<std::string>& program) {
    const Side side = browser_.side();
    const FileEntry* cursor = browser_.focused().cursorEntry();
    if (!cursor) return;
    const FileEntry entry = *cursor;
    std::string path = entry.path;
    std::string err;
    if (side == Side::Remote) {
        if (entry.isDir()) {
            logError("Cannot open a remote directory");
            return;
        }
        if (!downloadToCache(entry, path, err)) {
            remoteError("Could not download " + entry.path + ": " + err);
            return;
        }
    }
    const std::string cmd = (program ? *program : std::string("xdg-open")) + " " + shellQuote(path);
    std::string output;
    if (!host_.exec(parentPath(path), cmd + " >/dev/null &", output, err)) {
        const std::string msg = "Could not open " + entry.path + ": " + err;
        logError(msg);
        mountError(msg);
        return;
    }
    logInfo("Opened " + entry.path + (program ? " with " + *program : std::string()));
}

void FileTransferActivity::actionEditText() {
    const Side side = browser_.side();
    const FileEntry* cursor = browser_.focused().cursorEntry();
    if (!cursor) return;
    const FileEntry entry = *cursor;
    if (entry.isDir()) return;

    std::string path = entry.path;
    std::string err;
    if (side == Side::Remote && !downloadToCache(entry, path, err)) {
        remoteError("Could not download " + entry.path + ": " + err);
        return;
    }
    FileEntry before;
    const bool hadBefore = host_.stat(path, before, err);

    Terminal* t = terminal();
    if (t && !t->disableRawMode(err)) LOGW("failed to leave raw mode: %s", err.c_str());
    const std::string cmd = config_.textEditor + " " + shellQuote(path);
    const int rc = std::system(cmd.c_str());
    if (t) {
        if (!t->enableRawMode(err)) LOGE("failed to enter raw mode: %s", err.c_str());
        if (!t->clearScreen(err)) LOGE("failed to clear screen: %s", err.c_str());
    }
    redraw_ = true;
    if (rc != 0) {
        const std::string msg = "Editor \"" + config_.textEditor + "\" exited with status " + std::to_string(rc);
        logError(msg);
        mountError(msg);
        return;
    }
    logInfo("Edited " + entry.path);
    if (side == Side::Local) {
        reloadDir(side);
        return;
    }

    FileEntry after;
    if (!host_.stat(path, after, err)) {
        logError("Could not stat " + path + ": " + err);
        return;
    }
    if (hadBefore && after.mtime == before.mtime && after.size == before.size) {
        LOGD("%s not changed, not uploading", entry.path.c_str());
        return;
    }
    RemoteClient* client = this->client();
    if (!client || !client->put(path, entry.path, err)) {
        remoteError("Could not upload " + entry.path + ": " + (client ? err : std::string("not connected")));
        return;
    }
    logInfo("Uploaded changes to " + entry.path);
    reloadDir(side);
}

void FileTransferActivity::actionSearch(const std::string& pattern) {
    if (pattern.empty()) return;
    const Side side = browser_.side();
    FileExplorer& ex = browser_.explorer(side);
    const std::string root = ex.wrkdir();
    mountWait("Searching for \"" + pattern + "\"... (Esc to cancel)");
    view();
    abortRequested_ = false;

    std::vector<FileEntry> results;
    std::vector<std::string> dirs{root};
    while (!dirs.empty()) {
        pollAbort();
        if (abortRequested_) {
            view_.umount(Id::WaitPopup);
            logWarn("Search cancelled");
            return;
        }
        const std::string dir = dirs.back();
        dirs.pop_back();
        std::vector<FileEntry> files;
        std::string err;
        if (!listDir(side, dir, files, err)) {
            view_.umount(Id::WaitPopup);
            const std::string msg = "Search failed in " + dir + ": " + err;
            if (side == Side::Remote) remoteError(msg);
            else {
                logError(msg);
                mountError(msg);
            }
            return;
        }
        for (auto& f : files) {
            // Symlinked directories are matched but not descended into
            if (f.kind == FileKind::Directory) dirs.push_back(f.path);
            if (!globMatch(pattern, f.name)) continue;
            if (auto rel = relativePath(root, f.path)) f.name = *rel;
            results.push_back(std::move(f));
        }
    }
    view_.umount(Id::WaitPopup);
    logInfo("Search for \"" + pattern + "\" found " + std::to_string(results.size()) + " entries");

    auto found = std::make_unique<FileExplorer>(ex.sorting(), true);
    found->setWrkdir(root);
    found->setFiles(std::move(results));
    browser_.setFound(side, std::move(found));
}

void FileTransferActivity::actionToggleWatch() {
    view_.umount(Id::WatcherPopup);
    if (!watcher_) {
        const std::string msg = "File watcher is not available";
        logError(msg);
        mountError(msg);
        return;
    }
    const FileEntry* e = browser_.local().cursorEntry();
    if (!e) return;
    std::string err;
    if (watcher_->isWatched(e->path)) {
        if (watcher_->unwatch(e->path, err) != WatcherError::None) {
            logError("Could not unwatch " + e->path + ": " + err);
            return;
        }
        logInfo("Stopped watching " + e->path);
        return;
    }
    if (browser_.remote().wrkdir().empty()) {
        const std::string msg = "Cannot watch " + e->path + ": not connected";
        logError(msg);
        mountError(msg);
        return;
    }
    const std::string remote = joinPath(browser_.remote().wrkdir(), e->name);
    switch (watcher_->watch(e->path, remote, err)) {
        case WatcherError::None:
            logInfo("Watching " + e->path + " -> " + remote);
            break;
        case WatcherError::CapacityExceeded: {
            const std::string msg = "Cannot watch " + e->path + ": at most " +
                                    std::to_string(watcher_->capacity()) + " paths can be watched";
            logError(msg);
            mountError(msg);
            break;
        }
        default: {
            const std::string msg = "Cannot watch " + e->path + ": " + err;
            logError(msg);
            mountError(msg);
            break;
        }
    }
}

void FileTransferActivity::actionToggleWatchFor(std::size_t index) {
    if (!watcher_) return;
    const auto paths = watcher_->watchedPaths();
    if (index >= paths.size()) return;
    std::string err;
    if (watcher_->unwatch(paths[index].first, err) != WatcherError::None) {
        logError("Could not unwatch " + paths[index].first + ": " + err);
        return;
    }
    logInfo("Stopped watching " + paths[index].first);
    if (watcher_->watchedPaths().empty()) {
        view_.umount(Id::WatchedPathsList);
    } else {
        mountWatchedPathsList();
    }
}

} // namespace termxfer
