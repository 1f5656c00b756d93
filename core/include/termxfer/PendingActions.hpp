// Pending action queue: multi-step workflows (create a directory, then enter it;
// wait for conflict decisions, then run the queue) expressed as data.
// Actions run FIFO within their chain; a failure drops the rest of that chain only.
#pragma once
#include "Browser.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace termxfer {

struct PendingAction {
    enum class Kind {
        MakeDirectoryThen,           // create path on side, then run the continuation
        AwaitConflictResolutionThen  // wait until no conflict is left, then run the continuation
    };
    // What runs once the action's own step succeeded
    enum class Then {
        Nothing,
        EnterDirectory,  // enter path on side
        ExecuteQueue     // start the transfer queue
    };

    std::uint64_t chain = 0;
    Kind kind = Kind::MakeDirectoryThen;
    Then then = Then::Nothing;
    Side side = Side::Local;
    std::string path;
    bool confirmed = false; // user answered yes where a confirmation is needed
};

const char* pendingActionKindName(PendingAction::Kind k);

class PendingActionQueue {
public:
    using ReadyFn = std::function<bool(const PendingAction&)>;

    // Start a new causal chain.
    std::uint64_t newChain() { return nextChain_++; }
    void push(PendingAction action) { actions_.push_back(std::move(action)); }

    // Remove and return the first action that heads its chain and satisfies ready.
    std::optional<PendingAction> popReady(const ReadyFn& ready);

    // Drop the remaining actions of a chain. Returns how many were dropped.
    std::size_t dropChain(std::uint64_t chain);
    // Mark the head action of a chain as confirmed. Returns false if the chain is empty.
    bool confirmHead(std::uint64_t chain);
    const PendingAction* head(std::uint64_t chain) const;

    bool empty() const { return actions_.empty(); }
    std::size_t size() const { return actions_.size(); }
    const std::deque<PendingAction>& actions() const { return actions_; }
    void clear() { actions_.clear(); }

private:
    std::deque<PendingAction> actions_;
    std::uint64_t nextChain_ = 1;

    bool isHeadOfChain(std::size_t index) const;
};

} // namespace termxfer
