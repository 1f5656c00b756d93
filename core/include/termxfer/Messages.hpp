// Messages of the orchestration loop, one type per category.
#pragma once
#include "FileExplorer.hpp"
#include "TransferQueue.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace termxfer {

struct PendingActionMsg {
    enum class Kind {
        CloseReplacePopups,           // conflict decisions done
        CloseSyncBrowsingMkdirPopup,  // user declined the mirrored mkdir
        MakePendingDirectory,         // user confirmed the mirrored mkdir
        TransferPendingFile           // start the queue once its preconditions hold
    };
    Kind kind;
    std::uint64_t chain = 0;
};

struct TransferMsg {
    enum class Kind {
        AbortTransfer,
        CopyFileTo,
        CreateSymlink,
        DeleteFile,
        EnterDirectory,
        ExecuteCmd,
        GoTo,
        GoToParentDirectory,
        GoToPreviousDirectory,
        Mkdir,
        NewFile,
        OpenFile,
        OpenFileWith,
        OpenTextFile,
        ReloadDir,
        RenameFile,
        ResolveConflict,
        SaveFileAs,
        SearchFile,
        ToggleWatch,
        ToggleWatchFor,
        TransferFile
    };
    Kind kind;
    std::string arg;          // path, name, command or pattern
    std::size_t index = 0;    // ToggleWatchFor
    ConflictDecision decision = ConflictDecision::SkipThis;

    static TransferMsg make(Kind k, std::string arg = {}) {
        TransferMsg m{k};
        m.arg = std::move(arg);
        return m;
    }
};

struct UiMsg {
    enum class Kind {
        ChangeFileSorting,
        ChangeTransferWindow,
        CloseCopyPopup,
        CloseDeletePopup,
        CloseDisconnectPopup,
        CloseErrorPopup,
        CloseExecPopup,
        CloseFatalPopup,
        CloseFileInfoPopup,
        CloseFileSortingPopup,
        CloseFindExplorer,
        CloseFindPopup,
        CloseGotoPopup,
        CloseKeybindingsPopup,
        CloseMkdirPopup,
        CloseNewFilePopup,
        CloseOpenWithPopup,
        CloseQuitPopup,
        CloseRenamePopup,
        CloseSaveAsPopup,
        CloseSymlinkPopup,
        CloseWatchedPathsList,
        CloseWatcherPopup,
        Disconnect,
        LogBackTabbed,
        Quit,
        ReplacePopupTabbed,
        ShowCopyPopup,
        ShowDeletePopup,
        ShowDisconnectPopup,
        ShowExecPopup,
        ShowFileInfoPopup,
        ShowFileSortingPopup,
        ShowFindPopup,
        ShowGotoPopup,
        ShowKeybindingsPopup,
        ShowLogPanel,
        ShowMkdirPopup,
        ShowNewFilePopup,
        ShowOpenWithPopup,
        ShowQuitPopup,
        ShowRenamePopup,
        ShowSaveAsPopup,
        ShowSymlinkPopup,
        ShowWatchedPathsList,
        ShowWatcherPopup,
        ToggleHiddenFiles,
        ToggleSyncBrowsing,
        WindowResized
    };
    Kind kind;
    FileSorting sorting = FileSorting::Name;
};

using Msg = std::variant<PendingActionMsg, TransferMsg, UiMsg>;

} // namespace termxfer
