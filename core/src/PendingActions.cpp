#include "termxfer/PendingActions.hpp"
#include <algorithm>

namespace termxfer {

const char* pendingActionKindName(PendingAction::Kind k) {
    switch (k) {
        case PendingAction::Kind::MakeDirectoryThen: return "make-directory";
        case PendingAction::Kind::AwaitConflictResolutionThen: return "await-conflict-resolution";
    }
    return "?";
}

bool PendingActionQueue::isHeadOfChain(std::size_t index) const {
    for (std::size_t i = 0; i < index; ++i) {
        if (actions_[i].chain == actions_[index].chain) return false;
    }
    return true;
}

std::optional<PendingAction> PendingActionQueue::popReady(const ReadyFn& ready) {
    for (std::size_t i = 0; i < actions_.size(); ++i) {
        if (!isHeadOfChain(i) || !ready(actions_[i])) continue;
        PendingAction a = std::move(actions_[i]);
        actions_.erase(actions_.begin() + static_cast<long>(i));
        return a;
    }
    return std::nullopt;
}

std::size_t PendingActionQueue::dropChain(std::uint64_t chain) {
    const std::size_t before = actions_.size();
    actions_.erase(std::remove_if(actions_.begin(), actions_.end(),
                                  [chain](const PendingAction& a) { return a.chain == chain; }),
                   actions_.end());
    return before - actions_.size();
}

bool PendingActionQueue::confirmHead(std::uint64_t chain) {
    for (auto& a : actions_) {
        if (a.chain != chain) continue;
        a.confirmed = true;
        return true;
    }
    return false;
}

const PendingAction* PendingActionQueue::head(std::uint64_t chain) const {
    for (const auto& a : actions_) {
        if (a.chain == chain) return &a;
    }
    return nullptr;
}

} // namespace termxfer
