// Dual browser: local and remote panes, an optional search result pane, the focused tab
// and the sync-browsing state with its anchors.
#pragma once
#include "FileExplorer.hpp"
#include <memory>
#include <optional>
#include <string>

namespace termxfer {

enum class Side { Local, Remote };

enum class FileExplorerTab { Local, Remote, FindLocal, FindRemote };

inline Side otherSide(Side s) { return s == Side::Local ? Side::Remote : Side::Local; }
const char* sideName(Side s);

class Browser {
public:
    Browser(FileSorting sorting, bool showHidden);

    FileExplorer& local() { return local_; }
    const FileExplorer& local() const { return local_; }
    FileExplorer& remote() { return remote_; }
    const FileExplorer& remote() const { return remote_; }
    FileExplorer& explorer(Side s) { return s == Side::Local ? local_ : remote_; }
    const FileExplorer& explorer(Side s) const { return s == Side::Local ? local_ : remote_; }

    // Search results
    FileExplorer* found() { return found_.get(); }
    const FileExplorer* found() const { return found_.get(); }
    void setFound(Side side, std::unique_ptr<FileExplorer> found);
    void clearFound();

    FileExplorerTab tab() const { return tab_; }
    void changeTab(FileExplorerTab tab) { tab_ = tab; }
    // Side of the focused tab (a search tab belongs to the side it searched)
    Side side() const;
    bool inFindMode() const { return tab_ == FileExplorerTab::FindLocal || tab_ == FileExplorerTab::FindRemote; }
    // The pane that receives cursor movement: the found pane in search mode
    FileExplorer& focused();

    bool syncBrowsing() const { return syncBrowsing_; }
    void setSyncBrowsing(bool on) { syncBrowsing_ = on; }
    void toggleSyncBrowsing() { syncBrowsing_ = !syncBrowsing_; }

    void setAnchors(const std::string& localAnchor, const std::string& remoteAnchor);
    const std::optional<std::string>& anchor(Side s) const { return s == Side::Local ? localAnchor_ : remoteAnchor_; }

    // Directory on the other side with the same path relative to the anchors;
    // nullopt when anchors are unset or path is outside the anchor of its side.
    std::optional<std::string> mirrorPath(Side from, const std::string& path) const;

    void setSorting(FileSorting s);
    void setShowHidden(bool show);

private:
    FileExplorer local_;
    FileExplorer remote_;
    std::unique_ptr<FileExplorer> found_;
    FileExplorerTab tab_ = FileExplorerTab::Local;
    bool syncBrowsing_ = false;
    std::optional<std::string> localAnchor_;
    std::optional<std::string> remoteAnchor_;
};

} // namespace termxfer
