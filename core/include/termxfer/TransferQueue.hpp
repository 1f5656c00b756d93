// Transfer queue and executor (sequential) with conflict decisions, cooperative abort
// and resume after connection loss. One entry runs per step() so the caller can
// read input between entries.
#pragma once
#include "FileTypes.hpp"
#include "LocalHost.hpp"
#include "RemoteClient.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace termxfer {

// Upload: local -> remote. Download: remote -> local.
enum class TransferDirection { Upload, Download };

enum class TransferStatus { Pending, Conflict, Skipped, InProgress, Done, Failed };

enum class ConflictDecision { ReplaceThis, ReplaceAll, SkipThis, SkipAll, Abort };

const char* transferStatusName(TransferStatus s);

// Queue item.
// A Transfer entry copies src to dst; a Remove entry deletes dst on the destination side.
struct TransferEntry {
    enum class Action { Transfer, Remove };

    std::uint64_t id = 0;
    Action action = Action::Transfer;
    TransferDirection direction = TransferDirection::Upload;
    std::string src;
    std::string dst;
    bool isDir = false;
    std::uint64_t sizeHint = 0;
    TransferStatus status = TransferStatus::Pending;
    std::string error;        // reason for Failed
    bool resumeHint = false;  // continue a partial file on the next attempt
    bool replace = false;     // destination exists and the user chose to replace it
};

// Aggregated progress. Both progress bars derive from it.
struct TransferStates {
    std::optional<std::uint64_t> activeEntry;
    std::uint64_t bytesTotal = 0;
    std::uint64_t bytesDone = 0;
    std::size_t fileTotal = 0;
    std::size_t fileDone = 0;
    // Current file
    std::string fileName;
    std::uint64_t fileBytesTotal = 0;
    std::uint64_t fileBytesDone = 0;
    std::chrono::steady_clock::time_point startedAt{};
    bool aborted = false;

    double overallProgress() const { return bytesTotal ? double(bytesDone) / double(bytesTotal) : 0.0; }
    double fileProgress() const { return fileBytesTotal ? double(fileBytesDone) / double(fileBytesTotal) : 0.0; }
};

class TransferQueue {
public:
    enum class StepResult {
        Idle,              // nothing queued
        Progressed,        // one entry handled (it may have failed, see err)
        AwaitingDecision,  // next entry is a Conflict
        ConnectionLost,    // queue paused until the client is connected again
        Aborted,           // abort() took effect
        Finished           // last entry handled
    };

    // Called for every progress update with the current states.
    using ProgressHook = std::function<void(const TransferStates&)>;

    explicit TransferQueue(const LocalHost& local) : local_(local) {}

    // Build entries for a selection. Existing destinations become Conflict entries.
    // If newName is given (single entry) it replaces the destination base name.
    // On a check failure nothing is queued.
    bool enqueue(const std::vector<FileEntry>& selection,
                 TransferDirection direction,
                 const std::string& destDir,
                 RemoteClient* client,
                 std::string& err,
                 const std::optional<std::string>& newName = std::nullopt);

    // Queue one file or directory with an explicit destination; replace pre-resolves a conflict.
    bool enqueuePath(const std::string& src,
                     const std::string& dst,
                     TransferDirection direction,
                     bool replace,
                     RemoteClient* client,
                     std::string& err);

    // Queue removal of dst on the destination side of direction.
    void enqueueRemove(const std::string& dst, TransferDirection direction);

    // Decision for the first Conflict entry. *All decisions resolve every Conflict entry queued
    // so far; children of a replaced directory inherit the decision when it expands.
    void resolve(ConflictDecision decision);

    StepResult step(RemoteClient* client, std::string& err);
    // Run step() until the queue finishes, aborts, loses the connection or awaits a decision.
    StepResult execute(RemoteClient* client, std::string& err);

    // Cooperative: the in-flight transfer stops at its next chunk boundary.
    void abort();
    // Leave the paused state after a reconnection.
    void resume() { paused_ = false; }
    // Re-queue Failed entries.
    void retryFailed();
    // Drop Done/Skipped/Failed entries; only when the queue is idle.
    void clearFinished();
    void clear();

    void setProgressHook(ProgressHook hook) { progressHook_ = std::move(hook); }

    const std::vector<TransferEntry>& entries() const { return entries_; }
    const TransferStates& states() const { return states_; }
    std::vector<const TransferEntry*> conflicts() const;
    const TransferEntry* firstConflict() const;

    bool hasWork() const;
    bool isPaused() const { return paused_; }
    bool isAborted() const { return states_.aborted; }
    bool empty() const { return entries_.empty(); }

private:
    const LocalHost& local_;
    std::vector<TransferEntry> entries_;
    TransferStates states_;
    std::uint64_t nextId_ = 1;
    std::uint64_t committedBytes_ = 0; // bytes of finished files
    bool paused_ = false;
    bool running_ = false;
    ProgressHook progressHook_;

    void startRunIfIdle();
    bool destinationExists(const TransferEntry& e, RemoteClient* client, bool& exists, std::string& err) const;
    void countEntry(const TransferEntry& e);
    void uncountEntry(const TransferEntry& e);
    void skip(TransferEntry& e);
    bool runDirectory(std::size_t index, RemoteClient& client, std::string& err);
    bool runFile(TransferEntry& e, RemoteClient& client, std::string& err);
    bool runRemove(TransferEntry& e, RemoteClient& client, std::string& err);
    void notify();
};

} // namespace termxfer
