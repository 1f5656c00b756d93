#include "termxfer/Browser.hpp"
#include "termxfer/PathUtil.hpp"

namespace termxfer {

const char* sideName(Side s) {
    return s == Side::Local ? "local" : "remote";
}

Browser::Browser(FileSorting sorting, bool showHidden)
    : local_(sorting, showHidden), remote_(sorting, showHidden) {}

void Browser::setFound(Side side, std::unique_ptr<FileExplorer> found) {
    found_ = std::move(found);
    tab_ = side == Side::Local ? FileExplorerTab::FindLocal : FileExplorerTab::FindRemote;
}

void Browser::clearFound() {
    const Side s = side();
    found_.reset();
    tab_ = s == Side::Local ? FileExplorerTab::Local : FileExplorerTab::Remote;
}

Side Browser::side() const {
    switch (tab_) {
        case FileExplorerTab::Local:
        case FileExplorerTab::FindLocal:
            return Side::Local;
        case FileExplorerTab::Remote:
        case FileExplorerTab::FindRemote:
            return Side::Remote;
    }
    return Side::Local;
}

FileExplorer& Browser::focused() {
    if (inFindMode() && found_) return *found_;
    return explorer(side());
}

void Browser::setAnchors(const std::string& localAnchor, const std::string& remoteAnchor) {
    localAnchor_ = localAnchor;
    remoteAnchor_ = remoteAnchor;
}

std::optional<std::string> Browser::mirrorPath(Side from, const std::string& path) const {
    const auto& fromAnchor = anchor(from);
    const auto& toAnchor = anchor(otherSide(from));
    if (!fromAnchor || !toAnchor) return std::nullopt;
    auto rel = relativePath(*fromAnchor, path);
    if (!rel) return std::nullopt;
    return rel->empty() ? *toAnchor : joinPath(*toAnchor, *rel);
}

void Browser::setSorting(FileSorting s) {
    local_.setSorting(s);
    remote_.setSorting(s);
    if (found_) found_->setSorting(s);
}

void Browser::setShowHidden(bool show) {
    local_.setShowHidden(show);
    remote_.setShowHidden(show);
    if (found_) found_->setShowHidden(show);
}

} // namespace termxfer
