// File transfer activity: lifecycle hooks, connection handling, the tick and the message loop.
#include "termxfer/FileTransferActivity.hpp"
#include "termxfer/ClientBuilder.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtil.hpp"

namespace termxfer {

FileTransferActivity::FileTransferActivity(std::unique_ptr<RemoteClient> client, const Config& config,
                                           std::string buildError)
    : config_(config),
      conn_(std::move(client), config.reconnect, std::move(buildError)),
      browser_(config.sorting, config.showHidden),
      queue_(host_) {
    std::string err;
    cache_ = TempCache::create(err);
    if (!cache_) logError("Could not create the temporary cache: " + err);
    watcher_ = FsWatcher::init(config.watcherDelay, config.maxWatchedPaths, err);
    if (!watcher_) logError("Failed to initialize the file watcher: " + err);
    queue_.setProgressHook([this](const TransferStates&) { onTransferProgress(); });
}

FileTransferActivity::~FileTransferActivity() = default;

std::unique_ptr<FileTransferActivity> FileTransferActivity::fromParams(const FileTransferParams& params,
                                                                       const Config& config) {
    std::string err;
    auto client = buildClient(params, err);
    return std::make_unique<FileTransferActivity>(std::move(client), config, err);
}

void FileTransferActivity::onCreate(Context context) {
    LOGD("initializing file transfer activity");
    context_ = std::move(context);
    std::string err;
    if (Terminal* t = terminal()) {
        if (!t->clearScreen(err)) LOGE("failed to clear screen: %s", err.c_str());
        if (!t->enableRawMode(err)) LOGE("failed to enter raw mode: %s", err.c_str());
    }
    std::string localDir = context_->params.local_dir ? *context_->params.local_dir
                                                      : LocalHost::currentDirectory();
    localDir = resolvePath(LocalHost::currentDirectory(), localDir);
    if (!changeDir(Side::Local, localDir, false, false) && localDir != "/") {
        changeDir(Side::Local, "/", false, false);
    }
    if (context_->error) {
        LOGE("fatal error on create: %s", context_->error->c_str());
        mountFatal(*context_->error);
    } else if (conn_.state() == ConnectionState::Fatal) {
        mountFatal(conn_.fatalError());
    }
    redraw_ = true;
    LOGI("file transfer activity created");
}

void FileTransferActivity::onDraw() {
    if (!context_) return;
    if (conn_.noteConnectionLost()) logWarn("Connection to " + conn_.client()->description() + " lost");
    // Not while a fatal popup is up, or it would retry forever
    if (!conn_.isConnected() && !view_.mounted(Id::FatalPopup)) {
        if (conn_.state() == ConnectionState::Fatal) {
            view_.umount(Id::WaitPopup);
            mountFatal(conn_.fatalError());
        } else {
            connect();
        }
        redraw_ = true;
    }
    tick();
    pollWatcher();
    if (redraw_) view();
}

std::optional<Context> FileTransferActivity::onDestroy() {
    std::string err;
    if (cache_ && !cache_->close(err)) LOGE("failed to delete cache: %s", err.c_str());
    if (Terminal* t = terminal()) {
        if (!t->disableRawMode(err)) LOGE("failed to disable raw mode: %s", err.c_str());
        if (!t->clearScreen(err)) LOGE("failed to clear screen: %s", err.c_str());
    }
    if (watcher_) watcher_->stop();
    conn_.disconnect();
    std::optional<Context> ctx = std::move(context_);
    context_.reset();
    return ctx;
}

void FileTransferActivity::connect() {
    RemoteClient* c = conn_.client();
    if (!c) return;
    if (!view_.mounted(Id::WaitPopup)) {
        mountWait("Connecting to " + c->description() + "...");
        view();
    }
    std::string err;
    switch (conn_.tick(err)) {
        case ConnectionManager::TickResult::Connected:
            onConnected();
            break;
        case ConnectionManager::TickResult::Failed:
            logError("Could not connect to " + c->description() + ": " + err);
            mountWait("Connection failed: " + err + "\nRetrying in " +
                      std::to_string(conn_.currentDelay().count()) + "ms...");
            break;
        case ConnectionManager::TickResult::BecameFatal:
            view_.umount(Id::WaitPopup);
            logError(conn_.fatalError());
            mountFatal(conn_.fatalError());
            break;
        case ConnectionManager::TickResult::None:
            break;
    }
}

void FileTransferActivity::onConnected() {
    RemoteClient* c = conn_.client();
    view_.umount(Id::WaitPopup);
    logInfo("Established connection with " + c->description());

    std::string dir = browser_.remote().wrkdir();
    if (dir.empty()) {
        std::string err;
        if (context_ && context_->params.remote_dir) {
            dir = *context_->params.remote_dir;
        } else if (!c->workingDirectory(dir, err)) {
            logWarn("Could not get the remote working directory: " + err);
            dir = "/";
        }
    }
    if (!changeDir(Side::Remote, dir, false, false) && dir != "/") {
        changeDir(Side::Remote, "/", false, false);
    }
    if (!browser_.anchor(Side::Remote)) {
        browser_.setAnchors(browser_.local().wrkdir(), browser_.remote().wrkdir());
    }
    if (queue_.isPaused()) {
        queue_.resume();
        logInfo("Connection restored, resuming transfer");
    }
}

void FileTransferActivity::tick() {
    if (!deferredKeys_.empty()) {
        const KeyEvent ev = deferredKeys_.front();
        deferredKeys_.pop_front();
        onKey(ev);
    } else if (Terminal* t = terminal()) {
        if (auto ev = t->pollEvent(std::chrono::milliseconds(0))) onKey(*ev);
    }
    if (executing_) stepQueue();
}

void FileTransferActivity::stepQueue() {
    std::string err;
    const auto result = queue_.step(client(), err);
    redraw_ = true;
    switch (result) {
        case TransferQueue::StepResult::Idle:
            executing_ = false;
            view_.umount(Id::ProgressBar);
            break;
        case TransferQueue::StepResult::Progressed:
            if (!err.empty()) logError("Transfer failed: " + err);
            break;
        case TransferQueue::StepResult::AwaitingDecision:
            executing_ = false;
            view_.umount(Id::ProgressBar);
            if (auto m = startQueue()) dispatch(*m);
            break;
        case TransferQueue::StepResult::ConnectionLost:
            // Reconnection happens on the next draw; the queue resumes from this entry
            if (conn_.noteConnectionLost()) {
                logWarn("Connection lost, transfer paused" + (err.empty() ? std::string() : ": " + err));
            }
            break;
        case TransferQueue::StepResult::Aborted:
            executing_ = false;
            view_.umount(Id::ProgressBar);
            logWarn("Transfer aborted");
            reloadBoth();
            break;
        case TransferQueue::StepResult::Finished: {
            executing_ = false;
            view_.umount(Id::ProgressBar);
            const auto& s = queue_.states();
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - s.startedAt).count();
            logInfo("Transfer completed: " + std::to_string(s.fileDone) + " files, " +
                    std::to_string(s.bytesDone) + " bytes in " + std::to_string(ms / 1000.0).substr(0, 5) + "s");
            reloadBoth();
            break;
        }
    }
}

void FileTransferActivity::onTransferProgress() {
    if (!executing_) return;
    Terminal* t = terminal();
    if (!t) return;
    const auto now = std::chrono::steady_clock::now();
    if (now - lastProgressDraw_ >= std::chrono::milliseconds(50)) {
        lastProgressDraw_ = now;
        view();
    }
    pollAbort();
}

void FileTransferActivity::pollAbort() {
    Terminal* t = terminal();
    if (!t) return;
    auto ev = t->pollEvent(std::chrono::milliseconds(0));
    if (!ev) return;
    if (ev->key == KeyEvent::Key::Esc) {
        // Handled in place: dispatch would queue it behind the running operation
        updateTransfer(TransferMsg::make(TransferMsg::Kind::AbortTransfer));
        return;
    }
    if (deferredKeys_.size() < kDeferredKeys) deferredKeys_.push_back(*ev);
    else LOGW("dropping key typed during a long operation");
}

void FileTransferActivity::pollWatcher() {
    if (!watcher_) return;
    std::vector<FsChange> changes;
    std::string err;
    if (!watcher_->poll(changes, err)) logError("File watcher: " + err);
    if (changes.empty()) return;
    redraw_ = true;

    std::size_t queued = 0;
    for (const auto& c : changes) {
        recentChanges_.push_front(c);
        while (recentChanges_.size() > kRecentChanges) recentChanges_.pop_back();

        if (!browser_.syncBrowsing() || !isUnder(c.local, browser_.local().wrkdir())) {
            LOGD("change %s %s recorded only", fsChangeKindName(c.kind), c.local.c_str());
            continue;
        }
        RemoteClient* rc = client();
        if (!rc) {
            logWarn("Not connected, change to " + c.local + " not synchronized");
            continue;
        }
        std::string qerr;
        bool ok = true;
        switch (c.kind) {
            case FsChange::Kind::Created:
                ok = queue_.enqueuePath(c.local, c.remote, TransferDirection::Upload, false, rc, qerr);
                break;
            case FsChange::Kind::Modified:
                ok = queue_.enqueuePath(c.local, c.remote, TransferDirection::Upload, true, rc, qerr);
                break;
            case FsChange::Kind::Removed:
                queue_.enqueueRemove(c.remote, TransferDirection::Upload);
                break;
        }
        if (!ok) {
            logError("Could not synchronize " + c.local + ": " + qerr);
            continue;
        }
        ++queued;
    }
    if (queued) {
        logInfo("Synchronizing " + std::to_string(queued) + " local changes");
        if (auto m = startQueue()) dispatch(*m);
    }
}

void FileTransferActivity::remoteError(const std::string& msg) {
    logError(msg);
    mountError(msg);
    if (conn_.noteConnectionLost()) logWarn("Connection lost");
}

void FileTransferActivity::dispatch(Msg msg) {
    inbox_.push_back(std::move(msg));
    if (dispatching_) return;
    dispatching_ = true;
    while (!inbox_.empty()) {
        Msg m = std::move(inbox_.front());
        inbox_.pop_front();
        if (auto next = update(m)) inbox_.push_back(std::move(*next));
        if (auto drained = drainPending()) inbox_.push_back(std::move(*drained));
    }
    dispatching_ = false;
    redraw_ = true;
}

std::optional<Msg> FileTransferActivity::drainPending() {
    auto action = pending_.popReady([this](const PendingAction& a) { return pendingReady(a); });
    if (!action) return std::nullopt;
    std::optional<Msg> next;
    std::string err;
    if (!runPending(*action, next, err)) {
        const std::size_t dropped = pending_.dropChain(action->chain);
        LOGD("pending chain %llu failed, dropped %zu actions", (unsigned long long)action->chain, dropped);
        logError(err);
        mountError(err);
        return std::nullopt;
    }
    return next;
}

bool FileTransferActivity::pendingReady(const PendingAction& a) const {
    switch (a.kind) {
        case PendingAction::Kind::MakeDirectoryThen:
            return a.confirmed;
        case PendingAction::Kind::AwaitConflictResolutionThen:
            if (view_.mounted(Id::ReplacePopup) || view_.mounted(Id::ReplacingFilesListPopup)) return false;
            return queue_.isAborted() || queue_.firstConflict() == nullptr;
    }
    return false;
}

bool FileTransferActivity::runPending(const PendingAction& a, std::optional<Msg>& next, std::string& err) {
    switch (a.kind) {
        case PendingAction::Kind::MakeDirectoryThen: {
            if (a.side == Side::Local) {
                if (!host_.mkdirs(a.path, err)) return false;
            } else {
                RemoteClient* rc = client();
                if (!rc) {
                    err = "Not connected";
                    return false;
                }
                if (!rc->mkdir(a.path, err)) {
                    err = "Could not create remote directory " + a.path + ": " + err;
                    return false;
                }
            }
            logInfo("Created directory " + a.path);
            break;
        }
        case PendingAction::Kind::AwaitConflictResolutionThen:
            if (queue_.isAborted()) {
                err = "Transfer aborted";
                return false;
            }
            break;
    }
    switch (a.then) {
        case PendingAction::Then::Nothing:
            break;
        case PendingAction::Then::EnterDirectory:
            if (!changeDir(a.side, a.path, true, false)) {
                err = "Could not enter " + a.path;
                return false;
            }
            break;
        case PendingAction::Then::ExecuteQueue:
            next = PendingActionMsg{PendingActionMsg::Kind::TransferPendingFile, a.chain};
            break;
    }
    return true;
}

} // namespace termxfer
