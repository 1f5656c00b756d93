// Key bindings of the file transfer activity: popups first, then the log panel, then the explorers.
#include "termxfer/FileTransferActivity.hpp"
#include <algorithm>
#include <cctype>

namespace termxfer {

namespace {

using TK = TransferMsg::Kind;
using UK = UiMsg::Kind;

Msg ui(UK k) { return UiMsg{k}; }

bool isInputPopup(Id id) {
    switch (id) {
        case Id::CopyPopup:
        case Id::ExecPopup:
        case Id::FindPopup:
        case Id::GotoPopup:
        case Id::MkdirPopup:
        case Id::NewfilePopup:
        case Id::OpenWithPopup:
        case Id::RenamePopup:
        case Id::SaveAsPopup:
        case Id::SymlinkPopup:
            return true;
        default:
            return false;
    }
}

std::optional<Msg> submitInput(Id id, const std::string& text) {
    switch (id) {
        case Id::CopyPopup: return TransferMsg::make(TK::CopyFileTo, text);
        case Id::ExecPopup: return TransferMsg::make(TK::ExecuteCmd, text);
        case Id::FindPopup: return TransferMsg::make(TK::SearchFile, text);
        case Id::GotoPopup: return TransferMsg::make(TK::GoTo, text);
        case Id::MkdirPopup: return TransferMsg::make(TK::Mkdir, text);
        case Id::NewfilePopup: return TransferMsg::make(TK::NewFile, text);
        case Id::OpenWithPopup: return TransferMsg::make(TK::OpenFileWith, text);
        case Id::RenamePopup: return TransferMsg::make(TK::RenameFile, text);
        case Id::SaveAsPopup: return TransferMsg::make(TK::SaveFileAs, text);
        case Id::SymlinkPopup: return TransferMsg::make(TK::CreateSymlink, text);
        default: return std::nullopt;
    }
}

std::optional<Msg> closeInput(Id id) {
    switch (id) {
        case Id::CopyPopup: return ui(UK::CloseCopyPopup);
        case Id::ExecPopup: return ui(UK::CloseExecPopup);
        case Id::FindPopup: return ui(UK::CloseFindPopup);
        case Id::GotoPopup: return ui(UK::CloseGotoPopup);
        case Id::MkdirPopup: return ui(UK::CloseMkdirPopup);
        case Id::NewfilePopup: return ui(UK::CloseNewFilePopup);
        case Id::OpenWithPopup: return ui(UK::CloseOpenWithPopup);
        case Id::RenamePopup: return ui(UK::CloseRenamePopup);
        case Id::SaveAsPopup: return ui(UK::CloseSaveAsPopup);
        case Id::SymlinkPopup: return ui(UK::CloseSymlinkPopup);
        default: return std::nullopt;
    }
}

// Yes/no popups. Returns nullopt for popups that are not confirmations.
std::optional<Msg> confirmAnswer(const Popup& p, bool yes) {
    switch (p.id) {
        case Id::DeletePopup:
            return yes ? Msg(TransferMsg::make(TK::DeleteFile)) : ui(UK::CloseDeletePopup);
        case Id::DisconnectPopup:
            return yes ? ui(UK::Disconnect) : ui(UK::CloseDisconnectPopup);
        case Id::QuitPopup:
            return yes ? ui(UK::Quit) : ui(UK::CloseQuitPopup);
        case Id::WatcherPopup:
            return yes ? Msg(TransferMsg::make(TK::ToggleWatch)) : ui(UK::CloseWatcherPopup);
        case Id::SyncBrowsingMkdirPopup:
            return Msg(PendingActionMsg{yes ? PendingActionMsg::Kind::MakePendingDirectory
                                            : PendingActionMsg::Kind::CloseSyncBrowsingMkdirPopup,
                                        p.chain});
        default:
            return std::nullopt;
    }
}

bool isConfirmPopup(Id id) {
    return id == Id::DeletePopup || id == Id::DisconnectPopup || id == Id::QuitPopup ||
           id == Id::WatcherPopup || id == Id::SyncBrowsingMkdirPopup;
}

void moveSelection(Popup& p, long delta) {
    if (p.options.empty()) return;
    const long n = static_cast<long>(p.options.size());
    long next = (static_cast<long>(p.selected) + delta) % n;
    if (next < 0) next += n;
    p.selected = static_cast<std::size_t>(next);
}

void scrollSelection(Popup& p, long delta) {
    if (p.options.empty()) return;
    long next = static_cast<long>(p.selected) + delta;
    if (next < 0) next = 0;
    if (next >= static_cast<long>(p.options.size())) next = static_cast<long>(p.options.size()) - 1;
    p.selected = static_cast<std::size_t>(next);
}

} // namespace

void FileTransferActivity::onKey(const KeyEvent& ev) {
    redraw_ = true;
    if (ev.key == KeyEvent::Key::Resize) {
        dispatch(ui(UK::WindowResized));
        return;
    }
    if (Popup* top = view_.top()) {
        if (auto m = popupKey(*top, ev)) dispatch(std::move(*m));
        return;
    }
    if (view_.logFocused()) {
        logKey(ev);
        return;
    }
    if (auto m = explorerKey(ev)) dispatch(std::move(*m));
}

std::optional<Msg> FileTransferActivity::popupKey(Popup& p, const KeyEvent& ev) {
    using Key = KeyEvent::Key;

    if (isInputPopup(p.id)) {
        switch (ev.key) {
            case Key::Esc: return closeInput(p.id);
            case Key::Enter: return submitInput(p.id, p.input);
            case Key::Backspace:
                if (!p.input.empty()) p.input.pop_back();
                return std::nullopt;
            case Key::Char:
                if (!ev.ctrl && std::isprint(static_cast<unsigned char>(ev.ch))) p.input.push_back(ev.ch);
                return std::nullopt;
            default:
                return std::nullopt;
        }
    }

    if (isConfirmPopup(p.id)) {
        switch (ev.key) {
            case Key::Left:
            case Key::Right:
            case Key::Tab:
            case Key::BackTab:
                moveSelection(p, 1);
                return std::nullopt;
            case Key::Enter: return confirmAnswer(p, p.selected == 0);
            case Key::Esc: return confirmAnswer(p, false);
            case Key::Char:
                if (ev.is('y')) return confirmAnswer(p, true);
                if (ev.is('n')) return confirmAnswer(p, false);
                return std::nullopt;
            default:
                return std::nullopt;
        }
    }

    switch (p.id) {
        case Id::ReplacePopup:
            switch (ev.key) {
                case Key::Left: moveSelection(p, -1); return std::nullopt;
                case Key::Right: moveSelection(p, 1); return std::nullopt;
                case Key::Tab: return ui(UK::ReplacePopupTabbed);
                case Key::Esc: {
                    TransferMsg m = TransferMsg::make(TK::ResolveConflict);
                    m.decision = ConflictDecision::Abort;
                    return m;
                }
                case Key::Enter: {
                    TransferMsg m = TransferMsg::make(TK::ResolveConflict);
                    m.decision = static_cast<ConflictDecision>(p.selected);
                    return m;
                }
                default: return std::nullopt;
            }
        case Id::ReplacingFilesListPopup:
            switch (ev.key) {
                case Key::Up: scrollSelection(p, -1); return std::nullopt;
                case Key::Down: scrollSelection(p, 1); return std::nullopt;
                case Key::Tab:
                case Key::Enter:
                case Key::Esc: return ui(UK::ReplacePopupTabbed);
                default: return std::nullopt;
            }
        case Id::SortingPopup:
            switch (ev.key) {
                case Key::Left:
                case Key::Right: {
                    moveSelection(p, ev.key == Key::Left ? -1 : 1);
                    UiMsg m{UK::ChangeFileSorting};
                    m.sorting = static_cast<FileSorting>(p.selected);
                    return Msg(m);
                }
                case Key::Enter:
                case Key::Esc: return ui(UK::CloseFileSortingPopup);
                default: return std::nullopt;
            }
        case Id::WatchedPathsList:
            switch (ev.key) {
                case Key::Up: scrollSelection(p, -1); return std::nullopt;
                case Key::Down: scrollSelection(p, 1); return std::nullopt;
                case Key::Enter: {
                    if (p.options.empty()) return ui(UK::CloseWatchedPathsList);
                    TransferMsg m = TransferMsg::make(TK::ToggleWatchFor);
                    m.index = p.selected;
                    return m;
                }
                case Key::Esc: return ui(UK::CloseWatchedPathsList);
                default: return std::nullopt;
            }
        case Id::KeybindingsPopup:
            switch (ev.key) {
                case Key::Up: scrollSelection(p, -1); return std::nullopt;
                case Key::Down: scrollSelection(p, 1); return std::nullopt;
                case Key::Enter:
                case Key::Esc: return ui(UK::CloseKeybindingsPopup);
                default: return std::nullopt;
            }
        case Id::ErrorPopup:
            if (ev.key == Key::Enter || ev.key == Key::Esc) return ui(UK::CloseErrorPopup);
            return std::nullopt;
        case Id::FileInfoPopup:
            if (ev.key == Key::Enter || ev.key == Key::Esc) return ui(UK::CloseFileInfoPopup);
            return std::nullopt;
        case Id::FatalPopup:
            if (ev.key == Key::Enter || ev.key == Key::Esc) return ui(UK::CloseFatalPopup);
            return std::nullopt;
        case Id::ProgressBar:
            if (ev.key == Key::Esc) return TransferMsg::make(TK::AbortTransfer);
            return std::nullopt;
        case Id::WaitPopup:
        default:
            return std::nullopt;
    }
}

std::optional<Msg> FileTransferActivity::explorerKey(const KeyEvent& ev) {
    using Key = KeyEvent::Key;
    FileExplorer& ex = browser_.focused();
    switch (ev.key) {
        case Key::Up: ex.moveCursor(-1); return std::nullopt;
        case Key::Down: ex.moveCursor(1); return std::nullopt;
        case Key::PageUp: ex.moveCursor(-8); return std::nullopt;
        case Key::PageDown: ex.moveCursor(8); return std::nullopt;
        case Key::Home: ex.setCursor(0); return std::nullopt;
        case Key::End:
            if (ex.count()) ex.setCursor(ex.count() - 1);
            return std::nullopt;
        case Key::Left:
            if (browser_.side() == Side::Remote) return ui(UK::ChangeTransferWindow);
            return std::nullopt;
        case Key::Right:
            if (browser_.side() == Side::Local) return ui(UK::ChangeTransferWindow);
            return std::nullopt;
        case Key::Enter: return TransferMsg::make(TK::EnterDirectory);
        case Key::Backspace: return TransferMsg::make(TK::GoToPreviousDirectory);
        case Key::Delete: return ui(UK::ShowDeletePopup);
        case Key::Tab: return ui(UK::ShowLogPanel);
        case Key::Esc:
            return browser_.inFindMode() ? ui(UK::CloseFindExplorer) : ui(UK::ShowDisconnectPopup);
        case Key::Char:
            break;
        default:
            return std::nullopt;
    }

    if (ev.isCtrl('a')) {
        ex.markAll();
        return std::nullopt;
    }
    if (ev.ctrl) return std::nullopt;
    switch (ev.ch) {
        case ' ': return TransferMsg::make(TK::TransferFile);
        case 'a': return ui(UK::ToggleHiddenFiles);
        case 'b': return ui(UK::ShowFileSortingPopup);
        case 'c': return ui(UK::ShowCopyPopup);
        case 'd': return ui(UK::ShowMkdirPopup);
        case 'e': return ui(UK::ShowDeletePopup);
        case 'f': return ui(UK::ShowFindPopup);
        case 'g': return ui(UK::ShowGotoPopup);
        case 'h': return ui(UK::ShowKeybindingsPopup);
        case 'i': return ui(UK::ShowFileInfoPopup);
        case 'k': return ui(UK::ShowSymlinkPopup);
        case 'l': return TransferMsg::make(TK::ReloadDir);
        case 'm':
            ex.toggleMark(ex.cursor());
            return std::nullopt;
        case 'M':
            ex.clearMarks();
            return std::nullopt;
        case 'n': return ui(UK::ShowNewFilePopup);
        case 'o': return TransferMsg::make(TK::OpenTextFile);
        case 'p': return ui(UK::ShowLogPanel);
        case 'q': return ui(UK::ShowQuitPopup);
        case 'r': return ui(UK::ShowRenamePopup);
        case 's': return ui(UK::ShowSaveAsPopup);
        case 'u': return TransferMsg::make(TK::GoToParentDirectory);
        case 'v': return TransferMsg::make(TK::OpenFile);
        case 'w': return ui(UK::ShowOpenWithPopup);
        case 'x': return ui(UK::ShowExecPopup);
        case 'y': return ui(UK::ToggleSyncBrowsing);
        case 'z': return ui(UK::ShowWatcherPopup);
        case 'Z': return ui(UK::ShowWatchedPathsList);
        default: return std::nullopt;
    }
}

void FileTransferActivity::logKey(const KeyEvent& ev) {
    using Key = KeyEvent::Key;
    const std::size_t n = log_.size();
    std::size_t cursor = view_.logCursor();
    switch (ev.key) {
        case Key::Up:
            if (cursor > 0) view_.setLogCursor(cursor - 1);
            break;
        case Key::Down:
            if (cursor + 1 < n) view_.setLogCursor(cursor + 1);
            break;
        case Key::PageUp:
            view_.setLogCursor(cursor > 8 ? cursor - 8 : 0);
            break;
        case Key::PageDown:
            view_.setLogCursor(n == 0 ? 0 : std::min(cursor + 8, n - 1));
            break;
        case Key::Home:
            view_.setLogCursor(0);
            break;
        case Key::End:
            view_.setLogCursor(n ? n - 1 : 0);
            break;
        case Key::Tab:
        case Key::BackTab:
        case Key::Esc:
            dispatch(ui(UK::LogBackTabbed));
            break;
        case Key::Char:
            if (ev.is('p')) dispatch(ui(UK::LogBackTabbed));
            break;
        default:
            break;
    }
}

} // namespace termxfer
