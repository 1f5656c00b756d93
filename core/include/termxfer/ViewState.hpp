// Mounted popups and focus of the file transfer view.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace termxfer {

enum class Id {
    CopyPopup,
    DeletePopup,
    DisconnectPopup,
    ErrorPopup,
    ExecPopup,
    FatalPopup,
    FileInfoPopup,
    FindPopup,
    GotoPopup,
    KeybindingsPopup,
    MkdirPopup,
    NewfilePopup,
    OpenWithPopup,
    ProgressBar,
    QuitPopup,
    RenamePopup,
    ReplacePopup,
    ReplacingFilesListPopup,
    SaveAsPopup,
    SortingPopup,
    SymlinkPopup,
    SyncBrowsingMkdirPopup,
    WaitPopup,
    WatchedPathsList,
    WatcherPopup
};

struct Popup {
    Id id = Id::ErrorPopup;
    std::string title;
    std::vector<std::string> text;
    std::string input;                 // for input popups
    bool hasInput = false;
    std::vector<std::string> options;  // buttons or list items
    std::size_t selected = 0;
    std::uint64_t chain = 0;           // pending action chain the popup answers
};

class ViewState {
public:
    // Mount on top; an already mounted popup with the same id is replaced in place.
    void mount(Popup popup);
    void umount(Id id);
    bool mounted(Id id) const;
    Popup* get(Id id);
    const Popup* get(Id id) const;
    Popup* top() { return popups_.empty() ? nullptr : &popups_.back(); }
    const Popup* top() const { return popups_.empty() ? nullptr : &popups_.back(); }
    const std::vector<Popup>& popups() const { return popups_; }
    bool anyMounted() const { return !popups_.empty(); }

    bool logFocused() const { return logFocused_; }
    void setLogFocused(bool f) { logFocused_ = f; }
    std::size_t logCursor() const { return logCursor_; }
    void setLogCursor(std::size_t c) { logCursor_ = c; }

private:
    std::vector<Popup> popups_; // bottom to top
    bool logFocused_ = false;
    std::size_t logCursor_ = 0;
};

} // namespace termxfer
