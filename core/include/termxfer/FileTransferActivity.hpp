// File transfer activity: owns the connection, both panes, the transfer and pending
// action queues, the watcher bridge and the temp cache, and drives them from one
// message loop ticked by the application.
#pragma once
#include "Activity.hpp"
#include "Browser.hpp"
#include "Config.hpp"
#include "ConnectionManager.hpp"
#include "FsWatcher.hpp"
#include "LocalHost.hpp"
#include "LogRing.hpp"
#include "Messages.hpp"
#include "PendingActions.hpp"
#include "TempCache.hpp"
#include "TransferQueue.hpp"
#include "ViewState.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace termxfer {

class FileTransferActivity : public Activity {
public:
    // client may be null; buildError then explains why and the activity shows it as fatal.
    FileTransferActivity(std::unique_ptr<RemoteClient> client, const Config& config,
                         std::string buildError = {});
    ~FileTransferActivity() override;

    // Build the backend for params and the activity around it.
    static std::unique_ptr<FileTransferActivity> fromParams(const FileTransferParams& params,
                                                            const Config& config);

    void onCreate(Context context) override;
    void onDraw() override;
    std::optional<ExitReason> willUmount() const override { return exitReason_; }
    std::optional<Context> onDestroy() override;

    // Handle a message and everything it cascades into, including pending action drains.
    void dispatch(Msg msg);
    // Map one input event to cursor movement or a message.
    void onKey(const KeyEvent& ev);

    Browser& browser() { return browser_; }
    const TransferQueue& queue() const { return queue_; }
    const PendingActionQueue& pendingActions() const { return pending_; }
    const ViewState& viewState() const { return view_; }
    const LogRing& logRing() const { return log_; }
    const ConnectionManager& connection() const { return conn_; }
    FsWatcher* watcher() { return watcher_.get(); }
    const TempCache* tempCache() const { return cache_.get(); }
    bool isExecuting() const { return executing_; }
    bool needsRedraw() const { return redraw_; }

private:
    static constexpr std::size_t kRecentChanges = 64;
    static constexpr std::size_t kDeferredKeys = 16;

    std::optional<ExitReason> exitReason_;
    std::optional<Context> context_;
    Config config_;
    bool redraw_ = true;
    LocalHost host_;
    ConnectionManager conn_;
    Browser browser_;
    LogRing log_;
    TransferQueue queue_;
    PendingActionQueue pending_;
    ViewState view_;
    std::unique_ptr<TempCache> cache_;
    std::unique_ptr<FsWatcher> watcher_;

    bool executing_ = false;      // queue runs one entry per tick
    bool abortRequested_ = false; // set by AbortTransfer; transfers and searches stop on it
    bool dispatching_ = false;
    std::deque<Msg> inbox_;
    std::deque<FsChange> recentChanges_;
    std::deque<KeyEvent> deferredKeys_; // read during a long operation, handled on the next ticks
    std::chrono::steady_clock::time_point lastProgressDraw_{};

    // FileTransferActivity.cpp
    void connect();
    void onConnected();
    void tick();
    void stepQueue();
    void pollWatcher();
    void onTransferProgress();
    // Read one key inside a long operation: Esc aborts at once, anything else is deferred.
    void pollAbort();
    std::optional<Msg> drainPending();
    bool pendingReady(const PendingAction& a) const;
    bool runPending(const PendingAction& a, std::optional<Msg>& next, std::string& err);
    void logInfo(const std::string& msg) { log_.push(LogLevel::Info, msg); redraw_ = true; }
    void logWarn(const std::string& msg) { log_.push(LogLevel::Warn, msg); redraw_ = true; }
    void logError(const std::string& msg) { log_.push(LogLevel::Error, msg); redraw_ = true; }
    // Error on the remote side: also checks whether the connection dropped.
    void remoteError(const std::string& msg);
    Terminal* terminal() { return context_ ? context_->terminal : nullptr; }
    RemoteClient* client() { return conn_.isConnected() ? conn_.client() : nullptr; }

    // FileTransferUpdate.cpp
    std::optional<Msg> update(const Msg& msg);
    std::optional<Msg> updatePendingAction(const PendingActionMsg& msg);
    std::optional<Msg> updateTransfer(const TransferMsg& msg);
    std::optional<Msg> updateUi(const UiMsg& msg);

    // FileTransferActions.cpp
    bool listDir(Side side, const std::string& dir, std::vector<FileEntry>& out, std::string& err);
    bool changeDir(Side side, const std::string& dir, bool pushHistory, bool mirror = true);
    void reloadDir(Side side);
    void reloadBoth();
    void syncTo(Side target, const std::string& sourceDir);
    void toggleSyncBrowsing();
    std::vector<FileEntry> currentSelection();
    std::optional<Msg> transferSelection(const std::vector<FileEntry>& selection,
                                         const std::optional<std::string>& newName);
    std::optional<Msg> startQueue();
    void actionEnterDirectory();
    void actionGoToPrevious();
    void actionCopy(const std::string& dest);
    void actionSymlink(const std::string& name);
    void actionDelete();
    void actionMkdir(const std::string& name);
    void actionNewFile(const std::string& name);
    void actionRename(const std::string& dest);
    void actionExec(const std::string& cmd);
    void actionOpen(const std::optional<std::string>& program);
    void actionEditText();
    void actionSearch(const std::string& pattern);
    void actionToggleWatch();
    void actionToggleWatchFor(std::size_t index);
    bool remoteCopy(const FileEntry& src, const std::string& dst, std::string& err);
    bool downloadToCache(const FileEntry& entry, std::string& localPath, std::string& err);

    // FileTransferKeys.cpp
    std::optional<Msg> popupKey(Popup& popup, const KeyEvent& ev);
    std::optional<Msg> explorerKey(const KeyEvent& ev);
    void logKey(const KeyEvent& ev);

    // FileTransferView.cpp
    void view();
    Frame buildFrame() const;
    void mountError(const std::string& text);
    void mountFatal(const std::string& text);
    void mountWait(const std::string& text);
    void mountInput(Id id, const std::string& title, const std::string& initial = {});
    void mountConfirm(Id id, const std::string& title, const std::string& text, std::uint64_t chain = 0);
    void mountReplacePopup();
    void mountReplacingFilesList();
    void mountProgressBar();
    void mountSorting();
    void mountFileInfo();
    void mountKeybindings();
    void mountWatcherPopup();
    void mountWatchedPathsList();
};

} // namespace termxfer
