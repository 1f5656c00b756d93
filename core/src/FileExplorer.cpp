#include "termxfer/FileExplorer.hpp"
#include <algorithm>
#include <cctype>

namespace termxfer {

const char* fileSortingName(FileSorting s) {
    switch (s) {
        case FileSorting::Name: return "name";
        case FileSorting::ModifyTime: return "mtime";
        case FileSorting::Size: return "size";
    }
    return "name";
}

std::optional<FileSorting> fileSortingFromName(const std::string& name) {
    if (name == "name") return FileSorting::Name;
    if (name == "mtime") return FileSorting::ModifyTime;
    if (name == "size") return FileSorting::Size;
    return std::nullopt;
}

namespace {

bool lessNoCase(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char x, unsigned char y) {
                                            return std::tolower(x) < std::tolower(y);
                                        });
}

} // namespace

void FileExplorer::setFiles(std::vector<FileEntry> files) {
    files_ = std::move(files);
    std::set<std::string> keep;
    for (const auto& f : files_) {
        if (marked_.count(f.path)) keep.insert(f.path);
    }
    marked_.swap(keep);
    sortFiles();
    rebuildView();
}

void FileExplorer::clear() {
    files_.clear();
    view_.clear();
    marked_.clear();
    cursor_ = 0;
}

const FileEntry* FileExplorer::at(std::size_t index) const {
    if (index >= view_.size()) return nullptr;
    return &files_[view_[index]];
}

std::optional<std::size_t> FileExplorer::indexOf(const std::string& name) const {
    for (std::size_t i = 0; i < view_.size(); ++i) {
        if (files_[view_[i]].name == name) return i;
    }
    return std::nullopt;
}

void FileExplorer::setSorting(FileSorting s) {
    sorting_ = s;
    sortFiles();
    rebuildView();
}

void FileExplorer::setShowHidden(bool show) {
    showHidden_ = show;
    rebuildView();
}

void FileExplorer::setCursor(std::size_t index) {
    cursor_ = view_.empty() ? 0 : std::min(index, view_.size() - 1);
}

void FileExplorer::moveCursor(long delta) {
    if (view_.empty()) {
        cursor_ = 0;
        return;
    }
    long next = static_cast<long>(cursor_) + delta;
    if (next < 0) next = 0;
    setCursor(static_cast<std::size_t>(next));
}

void FileExplorer::toggleMark(std::size_t index) {
    const FileEntry* e = at(index);
    if (!e) return;
    if (!marked_.erase(e->path)) marked_.insert(e->path);
}

void FileExplorer::markAll() {
    for (std::size_t idx : view_) marked_.insert(files_[idx].path);
}

std::vector<FileEntry> FileExplorer::selection() const {
    std::vector<FileEntry> out;
    if (!marked_.empty()) {
        for (std::size_t idx : view_) {
            if (marked_.count(files_[idx].path)) out.push_back(files_[idx]);
        }
        return out;
    }
    if (const FileEntry* e = cursorEntry()) out.push_back(*e);
    return out;
}

void FileExplorer::pushHistory(const std::string& dir) {
    if (!history_.empty() && history_.back() == dir) return;
    history_.push_back(dir);
    while (history_.size() > kHistoryCapacity) history_.pop_front();
}

std::optional<std::string> FileExplorer::popHistory() {
    if (history_.empty()) return std::nullopt;
    std::string d = history_.back();
    history_.pop_back();
    return d;
}

void FileExplorer::sortFiles() {
    auto dirsFirst = [](const FileEntry& a, const FileEntry& b) { return a.isDir() && !b.isDir(); };
    std::stable_sort(files_.begin(), files_.end(), [&](const FileEntry& a, const FileEntry& b) {
        if (a.isDir() != b.isDir()) return dirsFirst(a, b);
        switch (sorting_) {
            case FileSorting::ModifyTime:
                if (a.mtime != b.mtime) return a.mtime > b.mtime; // newest first
                break;
            case FileSorting::Size:
                if (a.size != b.size) return a.size > b.size; // largest first
                break;
            case FileSorting::Name:
                break;
        }
        return lessNoCase(a.name, b.name);
    });
}

void FileExplorer::rebuildView() {
    view_.clear();
    for (std::size_t i = 0; i < files_.size(); ++i) {
        if (!showHidden_ && files_[i].isHidden()) continue;
        view_.push_back(i);
    }
    setCursor(cursor_);
}

} // namespace termxfer
