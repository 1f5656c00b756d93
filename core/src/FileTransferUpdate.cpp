// Message handling of the file transfer activity. Each handler may return one follow-up message.
#include "termxfer/FileTransferActivity.hpp"
#include "termxfer/Log.hpp"
#include "termxfer/PathUtil.hpp"
#include <type_traits>

namespace termxfer {

std::optional<Msg> FileTransferActivity::update(const Msg& msg) {
    redraw_ = true;
    return std::visit(
        [this](const auto& m) -> std::optional<Msg> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, PendingActionMsg>) {
                return updatePendingAction(m);
            } else if constexpr (std::is_same_v<T, TransferMsg>) {
                return updateTransfer(m);
            } else {
                return updateUi(m);
            }
        },
        msg);
}

std::optional<Msg> FileTransferActivity::updatePendingAction(const PendingActionMsg& msg) {
    switch (msg.kind) {
        case PendingActionMsg::Kind::CloseReplacePopups:
            view_.umount(Id::ReplacingFilesListPopup);
            view_.umount(Id::ReplacePopup);
            break;
        case PendingActionMsg::Kind::CloseSyncBrowsingMkdirPopup: {
            view_.umount(Id::SyncBrowsingMkdirPopup);
            const std::size_t dropped = pending_.dropChain(msg.chain);
            LOGD("sync browsing mkdir declined, dropped %zu pending actions", dropped);
            browser_.setSyncBrowsing(false);
            logWarn("Synchronized browsing disabled");
            break;
        }
        case PendingActionMsg::Kind::MakePendingDirectory:
            view_.umount(Id::SyncBrowsingMkdirPopup);
            if (!pending_.confirmHead(msg.chain)) LOGW("no pending action for chain %llu", (unsigned long long)msg.chain);
            break;
        case PendingActionMsg::Kind::TransferPendingFile:
            if (!queue_.hasWork()) {
                LOGD("transfer requested with an empty queue");
                break;
            }
            executing_ = true;
            mountProgressBar();
            break;
    }
    return std::nullopt;
}

std::optional<Msg> FileTransferActivity::updateTransfer(const TransferMsg& msg) {
    const Side side = browser_.side();
    switch (msg.kind) {
        case TransferMsg::Kind::AbortTransfer:
            abortRequested_ = true;
            if (executing_ || queue_.hasWork()) {
                queue_.abort();
                logWarn("Aborting transfer...");
            }
            break;
        case TransferMsg::Kind::CopyFileTo:
            view_.umount(Id::CopyPopup);
            actionCopy(msg.arg);
            break;
        case TransferMsg::Kind::CreateSymlink:
            view_.umount(Id::SymlinkPopup);
            actionSymlink(msg.arg);
            break;
        case TransferMsg::Kind::DeleteFile:
            view_.umount(Id::DeletePopup);
            actionDelete();
            break;
        case TransferMsg::Kind::EnterDirectory:
            actionEnterDirectory();
            break;
        case TransferMsg::Kind::ExecuteCmd:
            view_.umount(Id::ExecPopup);
            actionExec(msg.arg);
            break;
        case TransferMsg::Kind::GoTo:
            view_.umount(Id::GotoPopup);
            if (!msg.arg.empty()) {
                changeDir(side, resolvePath(browser_.explorer(side).wrkdir(), msg.arg), true);
            }
            break;
        case TransferMsg::Kind::GoToParentDirectory: {
            const std::string& wrkdir = browser_.explorer(side).wrkdir();
            if (wrkdir != "/") changeDir(side, parentPath(wrkdir), true);
            break;
        }
        case TransferMsg::Kind::GoToPreviousDirectory:
            actionGoToPrevious();
            break;
        case TransferMsg::Kind::Mkdir:
            view_.umount(Id::MkdirPopup);
            actionMkdir(msg.arg);
            break;
        case TransferMsg::Kind::NewFile:
            view_.umount(Id::NewfilePopup);
            actionNewFile(msg.arg);
            break;
        case TransferMsg::Kind::OpenFile:
            actionOpen(std::nullopt);
            break;
        case TransferMsg::Kind::OpenFileWith:
            view_.umount(Id::OpenWithPopup);
            actionOpen(msg.arg);
            break;
        case TransferMsg::Kind::OpenTextFile:
            actionEditText();
            break;
        case TransferMsg::Kind::ReloadDir:
            reloadDir(side);
            break;
        case TransferMsg::Kind::RenameFile:
            view_.umount(Id::RenamePopup);
            actionRename(msg.arg);
            break;
        case TransferMsg::Kind::ResolveConflict:
            queue_.resolve(msg.decision);
            if (msg.decision == ConflictDecision::Abort) {
                logWarn("Transfer aborted, replace declined");
            } else if (queue_.firstConflict()) {
                mountReplacePopup();
                break;
            }
            return PendingActionMsg{PendingActionMsg::Kind::CloseReplacePopups, 0};
        case TransferMsg::Kind::SaveFileAs: {
            view_.umount(Id::SaveAsPopup);
            if (msg.arg.empty()) break;
            return transferSelection(currentSelection(), msg.arg);
        }
        case TransferMsg::Kind::SearchFile:
            view_.umount(Id::FindPopup);
            actionSearch(msg.arg);
            break;
        case TransferMsg::Kind::ToggleWatch:
            actionToggleWatch();
            break;
        case TransferMsg::Kind::ToggleWatchFor:
            actionToggleWatchFor(msg.index);
            break;
        case TransferMsg::Kind::TransferFile:
            return transferSelection(currentSelection(), std::nullopt);
    }
    return std::nullopt;
}

std::optional<Msg> FileTransferActivity::updateUi(const UiMsg& msg) {
    switch (msg.kind) {
        case UiMsg::Kind::ChangeFileSorting:
            browser_.focused().setSorting(msg.sorting);
            if (Popup* p = view_.get(Id::SortingPopup)) p->selected = static_cast<std::size_t>(msg.sorting);
            break;
        case UiMsg::Kind::ChangeTransferWindow:
            switch (browser_.tab()) {
                case FileExplorerTab::Local:
                case FileExplorerTab::FindLocal:
                    browser_.changeTab(FileExplorerTab::Remote);
                    break;
                case FileExplorerTab::Remote:
                case FileExplorerTab::FindRemote:
                    browser_.changeTab(FileExplorerTab::Local);
                    break;
            }
            break;
        case UiMsg::Kind::CloseCopyPopup: view_.umount(Id::CopyPopup); break;
        case UiMsg::Kind::CloseDeletePopup: view_.umount(Id::DeletePopup); break;
        case UiMsg::Kind::CloseDisconnectPopup: view_.umount(Id::DisconnectPopup); break;
        case UiMsg::Kind::CloseErrorPopup: view_.umount(Id::ErrorPopup); break;
        case UiMsg::Kind::CloseExecPopup: view_.umount(Id::ExecPopup); break;
        case UiMsg::Kind::CloseFatalPopup:
            view_.umount(Id::FatalPopup);
            exitReason_ = ExitReason::Disconnect;
            break;
        case UiMsg::Kind::CloseFileInfoPopup: view_.umount(Id::FileInfoPopup); break;
        case UiMsg::Kind::CloseFileSortingPopup: view_.umount(Id::SortingPopup); break;
        case UiMsg::Kind::CloseFindExplorer:
            browser_.clearFound();
            break;
        case UiMsg::Kind::CloseFindPopup: view_.umount(Id::FindPopup); break;
        case UiMsg::Kind::CloseGotoPopup: view_.umount(Id::GotoPopup); break;
        case UiMsg::Kind::CloseKeybindingsPopup: view_.umount(Id::KeybindingsPopup); break;
        case UiMsg::Kind::CloseMkdirPopup: view_.umount(Id::MkdirPopup); break;
        case UiMsg::Kind::CloseNewFilePopup: view_.umount(Id::NewfilePopup); break;
        case UiMsg::Kind::CloseOpenWithPopup: view_.umount(Id::OpenWithPopup); break;
        case UiMsg::Kind::CloseQuitPopup: view_.umount(Id::QuitPopup); break;
        case UiMsg::Kind::CloseRenamePopup: view_.umount(Id::RenamePopup); break;
        case UiMsg::Kind::CloseSaveAsPopup: view_.umount(Id::SaveAsPopup); break;
        case UiMsg::Kind::CloseSymlinkPopup: view_.umount(Id::SymlinkPopup); break;
        case UiMsg::Kind::CloseWatchedPathsList: view_.umount(Id::WatchedPathsList); break;
        case UiMsg::Kind::CloseWatcherPopup: view_.umount(Id::WatcherPopup); break;
        case UiMsg::Kind::Disconnect:
            view_.umount(Id::DisconnectPopup);
            exitReason_ = ExitReason::Disconnect;
            break;
        case UiMsg::Kind::LogBackTabbed:
            view_.setLogFocused(false);
            break;
        case UiMsg::Kind::Quit:
            view_.umount(Id::QuitPopup);
            exitReason_ = ExitReason::Quit;
            break;
        case UiMsg::Kind::ReplacePopupTabbed:
            if (view_.mounted(Id::ReplacingFilesListPopup)) {
                view_.umount(Id::ReplacingFilesListPopup);
            } else if (view_.mounted(Id::ReplacePopup)) {
                mountReplacingFilesList();
            }
            break;
        case UiMsg::Kind::ShowCopyPopup: mountInput(Id::CopyPopup, "Copy file(s) to..."); break;
        case UiMsg::Kind::ShowDeletePopup: {
            const auto sel = currentSelection();
            if (sel.empty()) break;
            const std::string what = sel.size() == 1 ? sel.front().name : std::to_string(sel.size()) + " files";
            mountConfirm(Id::DeletePopup, "Delete file(s)", "Delete " + what + "?");
            break;
        }
        case UiMsg::Kind::ShowDisconnectPopup:
            mountConfirm(Id::DisconnectPopup, "Disconnect", "Are you sure you want to disconnect?");
            break;
        case UiMsg::Kind::ShowExecPopup: mountInput(Id::ExecPopup, "Execute command"); break;
        case UiMsg::Kind::ShowFileInfoPopup: mountFileInfo(); break;
        case UiMsg::Kind::ShowFileSortingPopup: mountSorting(); break;
        case UiMsg::Kind::ShowFindPopup: mountInput(Id::FindPopup, "Search files by name or glob"); break;
        case UiMsg::Kind::ShowGotoPopup: mountInput(Id::GotoPopup, "Change working directory"); break;
        case UiMsg::Kind::ShowKeybindingsPopup: mountKeybindings(); break;
        case UiMsg::Kind::ShowLogPanel:
            view_.setLogFocused(true);
            break;
        case UiMsg::Kind::ShowMkdirPopup: mountInput(Id::MkdirPopup, "New directory name"); break;
        case UiMsg::Kind::ShowNewFilePopup: mountInput(Id::NewfilePopup, "New file name"); break;
        case UiMsg::Kind::ShowOpenWithPopup: mountInput(Id::OpenWithPopup, "Open file with..."); break;
        case UiMsg::Kind::ShowQuitPopup:
            mountConfirm(Id::QuitPopup, "Quit", "Are you sure you want to quit?");
            break;
        case UiMsg::Kind::ShowRenamePopup: {
            const FileEntry* e = browser_.focused().cursorEntry();
            mountInput(Id::RenamePopup, "Move file(s) to...", e ? e->name : std::string());
            break;
        }
        case UiMsg::Kind::ShowSaveAsPopup: mountInput(Id::SaveAsPopup, "Save as..."); break;
        case UiMsg::Kind::ShowSymlinkPopup: mountInput(Id::SymlinkPopup, "Symlink name"); break;
        case UiMsg::Kind::ShowWatchedPathsList: mountWatchedPathsList(); break;
        case UiMsg::Kind::ShowWatcherPopup: mountWatcherPopup(); break;
        case UiMsg::Kind::ToggleHiddenFiles:
            browser_.focused().toggleHidden();
            break;
        case UiMsg::Kind::ToggleSyncBrowsing:
            toggleSyncBrowsing();
            break;
        case UiMsg::Kind::WindowResized:
            break;
    }
    return std::nullopt;
}

} // namespace termxfer
