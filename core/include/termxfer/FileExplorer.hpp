// One browsing pane: working directory, the last good listing and the view over it
// (sorting, hidden filter, cursor, marks, history).
#pragma once
#include "FileTypes.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace termxfer {

enum class FileSorting { Name, ModifyTime, Size };

const char* fileSortingName(FileSorting s);
std::optional<FileSorting> fileSortingFromName(const std::string& name);

class FileExplorer {
public:
    static constexpr std::size_t kHistoryCapacity = 16;

    FileExplorer() = default;
    FileExplorer(FileSorting sorting, bool showHidden) : sorting_(sorting), showHidden_(showHidden) {}

    const std::string& wrkdir() const { return wrkdir_; }
    void setWrkdir(const std::string& dir) { wrkdir_ = dir; }

    // Replace the snapshot. Marks that no longer exist are dropped and the cursor is clamped.
    void setFiles(std::vector<FileEntry> files);
    const std::vector<FileEntry>& files() const { return files_; }
    void clear();

    // Visible entries (sorted, hidden filter applied)
    std::size_t count() const { return view_.size(); }
    const FileEntry* at(std::size_t index) const;
    std::optional<std::size_t> indexOf(const std::string& name) const;

    FileSorting sorting() const { return sorting_; }
    void setSorting(FileSorting s);
    bool showHidden() const { return showHidden_; }
    void setShowHidden(bool show);
    void toggleHidden() { setShowHidden(!showHidden_); }

    std::size_t cursor() const { return cursor_; }
    void setCursor(std::size_t index);
    void moveCursor(long delta);
    const FileEntry* cursorEntry() const { return at(cursor_); }

    void toggleMark(std::size_t index);
    void markAll();
    void clearMarks() { marked_.clear(); }
    bool isMarked(const std::string& path) const { return marked_.count(path) != 0; }
    std::size_t markedCount() const { return marked_.size(); }

    // Marked entries in view order, or the entry under the cursor when nothing is marked.
    std::vector<FileEntry> selection() const;

    void pushHistory(const std::string& dir);
    std::optional<std::string> popHistory();
    std::size_t historySize() const { return history_.size(); }

private:
    std::string wrkdir_;
    std::vector<FileEntry> files_;
    std::vector<std::size_t> view_; // indices into files_
    FileSorting sorting_ = FileSorting::Name;
    bool showHidden_ = false;
    std::size_t cursor_ = 0;
    std::set<std::string> marked_;
    std::deque<std::string> history_; // back = most recent

    void sortFiles();
    void rebuildView();
};

} // namespace termxfer
