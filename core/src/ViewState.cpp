#include "termxfer/ViewState.hpp"
#include <algorithm>

namespace termxfer {

void ViewState::mount(Popup popup) {
    for (auto& p : popups_) {
        if (p.id == popup.id) {
            p = std::move(popup);
            return;
        }
    }
    popups_.push_back(std::move(popup));
}

void ViewState::umount(Id id) {
    popups_.erase(std::remove_if(popups_.begin(), popups_.end(), [id](const Popup& p) { return p.id == id; }),
                  popups_.end());
}

bool ViewState::mounted(Id id) const {
    return get(id) != nullptr;
}

Popup* ViewState::get(Id id) {
    for (auto& p : popups_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

const Popup* ViewState::get(Id id) const {
    for (const auto& p : popups_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

} // namespace termxfer
