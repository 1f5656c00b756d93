// File transfer activity view: frame assembly and popup mounting.
#include "termxfer/FileTransferActivity.hpp"
#include "termxfer/PathUtil.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace termxfer {

namespace {

std::string formatSize(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    if (u == 0) std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
    else std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
    return buf;
}

std::string formatTime(std::time_t t, const char* fmt) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string formatMode(std::uint32_t mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", mode & 07777);
    return buf;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    if (out.empty()) out.emplace_back();
    return out;
}

std::string entryLine(const FileEntry& e) {
    std::string name = e.name;
    if (e.kind == FileKind::Directory) name += "/";
    else if (e.kind == FileKind::Symlink) name += " -> " + e.symlink_target;
    std::string size = e.isDir() ? std::string() : formatSize(e.size);
    return name + (size.empty() ? std::string() : "  " + size) + "  " +
           formatTime(static_cast<std::time_t>(e.mtime), "%Y-%m-%d %H:%M");
}

PaneView paneView(const FileExplorer& ex, const std::string& title, bool focused, const std::string& colour) {
    PaneView v;
    v.title = title;
    v.cursor = ex.cursor();
    v.focused = focused;
    v.colour = colour;
    v.lines.reserve(ex.count());
    v.marked.reserve(ex.count());
    for (std::size_t i = 0; i < ex.count(); ++i) {
        const FileEntry* e = ex.at(i);
        v.lines.push_back(entryLine(*e));
        v.marked.push_back(ex.isMarked(e->path));
    }
    return v;
}

} // namespace

void FileTransferActivity::view() {
    redraw_ = false;
    Terminal* t = terminal();
    if (!t) return;
    t->render(buildFrame());
}

Frame FileTransferActivity::buildFrame() const {
    Frame f;
    f.theme = config_.theme;
    f.logHeight = config_.logPanelHeight;

    const FileExplorerTab tab = browser_.tab();
    const Side side = browser_.side();
    const bool panesFocused = !view_.logFocused();
    const FileExplorer* found = browser_.found();

    const std::string localTitle = "Localhost: " + browser_.local().wrkdir();
    if (tab == FileExplorerTab::FindLocal && found) {
        f.left = paneView(*found, "Search results in " + found->wrkdir(), panesFocused, config_.theme.explorerLocal);
    } else {
        f.left = paneView(browser_.local(), localTitle, panesFocused && side == Side::Local,
                          config_.theme.explorerLocal);
    }

    const RemoteClient* rc = conn_.client();
    const std::string remoteName = rc ? rc->description() : std::string("(no backend)");
    const std::string remoteTitle = remoteName + ": " + browser_.remote().wrkdir();
    if (tab == FileExplorerTab::FindRemote && found) {
        f.right = paneView(*found, "Search results in " + found->wrkdir(), panesFocused, config_.theme.explorerRemote);
    } else {
        f.right = paneView(browser_.remote(), remoteTitle, panesFocused && side == Side::Remote,
                           config_.theme.explorerRemote);
    }

    for (const auto& r : log_.records()) {
        LogLine l;
        l.level = r.level;
        l.text = formatTime(std::chrono::system_clock::to_time_t(r.time), "%H:%M:%S") + " [" +
                 logLevelName(r.level) + "] " + r.message;
        f.log.push_back(std::move(l));
    }
    f.logCursor = view_.logCursor();
    f.logFocused = view_.logFocused();

    const FileExplorer& ex = browser_.explorer(side);
    std::string status = std::string("Sort: ") + fileSortingName(ex.sorting()) +
                         "  Hidden: " + (ex.showHidden() ? "show" : "hide") +
                         "  Sync browsing: " + (browser_.syncBrowsing() ? "ON" : "OFF") +
                         "  Connection: " + connectionStateName(conn_.state());
    if (watcher_) status += "  Watched: " + std::to_string(watcher_->watchedPaths().size());
    if (queue_.isPaused()) status += "  Transfer paused";
    f.status = status;
    f.footer = "<H> Help  <TAB> Log  <SPACE> Transfer  <ENTER> Enter dir  <E> Delete  <Q> Quit";

    for (const auto& p : view_.popups()) {
        PopupView pv;
        pv.title = p.title;
        pv.lines = p.text;
        if (p.hasInput) pv.input = p.input;
        pv.options = p.options;
        pv.selected = p.selected;
        pv.list = p.id == Id::ReplacingFilesListPopup || p.id == Id::KeybindingsPopup ||
                  p.id == Id::WatchedPathsList;
        pv.colour = (p.id == Id::ErrorPopup || p.id == Id::FatalPopup) ? config_.theme.error : config_.theme.popup;
        if (p.id == Id::ProgressBar) {
            const TransferStates& s = queue_.states();
            pv.colour = config_.theme.progressBar;
            pv.lines.clear();
            pv.lines.push_back(s.fileName.empty() ? std::string("Preparing...") : s.fileName);
            pv.lines.push_back(formatSize(s.fileBytesDone) + " / " + formatSize(s.fileBytesTotal));
            pv.lines.push_back("Total: " + std::to_string(s.fileDone) + " / " + std::to_string(s.fileTotal) +
                               " files, " + formatSize(s.bytesDone) + " / " + formatSize(s.bytesTotal));
            pv.lines.push_back("Press <ESC> to abort");
            pv.progress = s.fileProgress();
            pv.progressTotal = s.overallProgress();
        }
        f.popups.push_back(std::move(pv));
    }
    return f;
}

void FileTransferActivity::mountError(const std::string& text) {
    Popup p;
    p.id = Id::ErrorPopup;
    p.title = "Error";
    p.text = splitLines(text);
    p.options = {"Ok"};
    view_.mount(std::move(p));
    redraw_ = true;
}

void FileTransferActivity::mountFatal(const std::string& text) {
    Popup p;
    p.id = Id::FatalPopup;
    p.title = "Fatal error";
    p.text = splitLines(text);
    p.options = {"Ok"};
    view_.mount(std::move(p));
    redraw_ = true;
}

void FileTransferActivity::mountWait(const std::string& text) {
    Popup p;
    p.id = Id::WaitPopup;
    p.title = "Please wait";
    p.text = splitLines(text);
    view_.mount(std::move(p));
    redraw_ = true;
}

void FileTransferActivity::mountInput(Id id, const std::string& title, const std::string& initial) {
    Popup p;
    p.id = id;
    p.title = title;
    p.hasInput = true;
    p.input = initial;
    view_.mount(std::move(p));
}

void FileTransferActivity::mountConfirm(Id id, const std::string& title, const std::string& text, std::uint64_t chain) {
    Popup p;
    p.id = id;
    p.title = title;
    p.text = splitLines(text);
    p.options = {"Yes", "No"};
    p.selected = id == Id::DeletePopup ? 1 : 0;
    p.chain = chain;
    view_.mount(std::move(p));
    redraw_ = true;
}

void FileTransferActivity::mountReplacePopup() {
    const TransferEntry* first = queue_.firstConflict();
    if (!first) return;
    const std::size_t count = queue_.conflicts().size();
    const bool firstPrompt = !view_.mounted(Id::ReplacePopup);
    Popup p;
    p.id = Id::ReplacePopup;
    p.title = "Replace file?";
    p.text.push_back(first->dst + " already exists.");
    if (count > 1) p.text.push_back(std::to_string(count) + " files in conflict (<TAB> to list them)");
    // Order follows ConflictDecision
    p.options = {"Replace", "Replace all", "Skip", "Skip all", "Abort"};
    view_.mount(std::move(p));
    // Several conflicts: show what would be replaced before asking
    if (firstPrompt && count > 1) mountReplacingFilesList();
    redraw_ = true;
}

void FileTransferActivity::mountReplacingFilesList() {
    Popup list;
    list.id = Id::ReplacingFilesListPopup;
    list.title = "Files to replace (<TAB> to decide)";
    for (const TransferEntry* e : queue_.conflicts()) list.options.push_back(e->dst);
    view_.mount(std::move(list));
    redraw_ = true;
}

void FileTransferActivity::mountProgressBar() {
    Popup p;
    p.id = Id::ProgressBar;
    p.title = "Transfer in progress";
    view_.mount(std::move(p));
    redraw_ = true;
}

void FileTransferActivity::mountSorting() {
    Popup p;
    p.id = Id::SortingPopup;
    p.title = "File sorting";
    p.options = {"Name", "Modify time", "Size"};
    p.selected = static_cast<std::size_t>(browser_.focused().sorting());
    view_.mount(std::move(p));
}

void FileTransferActivity::mountFileInfo() {
    const FileEntry* e = browser_.focused().cursorEntry();
    if (!e) return;
    Popup p;
    p.id = Id::FileInfoPopup;
    p.title = e->name;
    p.text.push_back("Path: " + e->path);
    switch (e->kind) {
        case FileKind::File: p.text.push_back("Type: file"); break;
        case FileKind::Directory: p.text.push_back("Type: directory"); break;
        case FileKind::Symlink:
            p.text.push_back("Type: symlink");
            p.text.push_back("Target: " + e->symlink_target);
            break;
    }
    if (!e->isDir()) p.text.push_back("Size: " + formatSize(e->size) + " (" + std::to_string(e->size) + ")");
    p.text.push_back("Modified: " + formatTime(static_cast<std::time_t>(e->mtime), "%Y-%m-%d %H:%M:%S"));
    p.text.push_back("Permissions: " + formatMode(e->mode));
    p.options = {"Ok"};
    view_.mount(std::move(p));
}

void FileTransferActivity::mountKeybindings() {
    Popup p;
    p.id = Id::KeybindingsPopup;
    p.title = "Keybindings";
    p.options = {
        "<ESC>        Disconnect / close search results",
        "<TAB> <P>    Switch to the log panel",
        "<LEFT/RIGHT> Change explorer tab",
        "<UP/DOWN>    Move cursor",
        "<PGUP/PGDN>  Scroll by 8 entries",
        "<ENTER>      Enter directory",
        "<SPACE>      Upload / download selection",
        "<BACKSPACE>  Go to previous directory",
        "<A>          Toggle hidden files",
        "<B>          Change file sorting",
        "<C>          Copy",
        "<D>          Make directory",
        "<E> <DEL>    Delete",
        "<F>          Search files",
        "<G>          Go to path",
        "<H>          Show this help",
        "<I>          File info",
        "<K>          Create symlink",
        "<L>          Reload directory",
        "<M>          Toggle mark",
        "<CTRL+A>     Mark all",
        "<SHIFT+M>    Clear marks",
        "<N>          New file",
        "<O>          Edit text file",
        "<Q>          Quit",
        "<R>          Rename / move",
        "<S>          Save as",
        "<U>          Go to parent directory",
        "<V>          Open with default program",
        "<W>          Open with...",
        "<X>          Execute command",
        "<Y>          Toggle synchronized browsing",
        "<Z>          Watch / unwatch for changes",
        "<SHIFT+Z>    Show watched paths",
    };
    view_.mount(std::move(p));
}

void FileTransferActivity::mountWatcherPopup() {
    const FileEntry* e = browser_.local().cursorEntry();
    if (!e) return;
    if (watcher_ && watcher_->isWatched(e->path)) {
        mountConfirm(Id::WatcherPopup, "File watcher", "Stop watching " + e->path + "?");
    } else {
        mountConfirm(Id::WatcherPopup, "File watcher",
                     "Synchronize changes of " + e->path + " to " +
                         joinPath(browser_.remote().wrkdir(), e->name) + "?");
    }
}

void FileTransferActivity::mountWatchedPathsList() {
    if (!watcher_) {
        mountError("File watcher is not available");
        return;
    }
    const auto paths = watcher_->watchedPaths();
    Popup p;
    p.id = Id::WatchedPathsList;
    p.title = "Watched paths (" + std::to_string(paths.size()) + "/" + std::to_string(watcher_->capacity()) + ")";
    for (const auto& kv : paths) p.options.push_back(kv.first + " -> " + kv.second);
    if (const Popup* old = view_.get(Id::WatchedPathsList)) {
        p.selected = p.options.empty() ? 0 : std::min(old->selected, p.options.size() - 1);
    }
    if (p.options.empty()) p.text.push_back("No path is being watched");
    if (!recentChanges_.empty()) {
        const FsChange& last = recentChanges_.front();
        p.text.push_back(std::string("Last change: ") + fsChangeKindName(last.kind) + " " + last.local + " (" +
                         std::to_string(recentChanges_.size()) + " recent)");
    }
    view_.mount(std::move(p));
}

} // namespace termxfer
