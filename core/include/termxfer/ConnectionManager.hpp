// Connection lifecycle of the remote client: Disconnected -> Connecting -> Connected,
// back to Disconnected on loss, Fatal when no backend exists or retries are exhausted.
#pragma once
#include "RemoteClient.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace termxfer {

enum class ConnectionState { Disconnected, Connecting, Connected, Fatal };

const char* connectionStateName(ConnectionState s);

struct ReconnectPolicy {
    int maxAttempts = 5; // consecutive failures before Fatal; 0 = unlimited
    std::chrono::milliseconds initialDelay{500};
    std::chrono::milliseconds maxDelay{8000};
};

class ConnectionManager {
public:
    using Clock = std::chrono::steady_clock;

    enum class TickResult {
        None,         // nothing to do (connected, waiting for backoff, or fatal)
        Connected,    // connect() just succeeded
        Failed,       // connect() failed; err holds the reason
        BecameFatal   // retries exhausted or no backend
    };

    // client may be null: the manager starts Fatal with fatalError.
    ConnectionManager(std::unique_ptr<RemoteClient> client, ReconnectPolicy policy,
                      std::string fatalError = {});
    ~ConnectionManager();

    ConnectionState state() const { return state_; }
    const std::string& fatalError() const { return fatalError_; }
    RemoteClient* client() { return client_.get(); }
    const RemoteClient* client() const { return client_.get(); }
    bool isConnected() const { return state_ == ConnectionState::Connected; }

    // One connection attempt when due. Never sleeps.
    TickResult tick(std::string& err, Clock::time_point now = Clock::now());
    // Re-check liveness; moves to Disconnected when the client dropped.
    bool refresh();
    // Report a failed operation; returns true if it was a connection loss.
    bool noteConnectionLost();
    // Idempotent.
    void disconnect();

    int attempts() const { return attempts_; }
    int connectionCount() const { return connections_; }
    std::chrono::milliseconds currentDelay() const { return delay_; }

private:
    std::unique_ptr<RemoteClient> client_;
    ReconnectPolicy policy_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string fatalError_;
    int attempts_ = 0;    // consecutive failures
    int connections_ = 0; // successful connects
    std::chrono::milliseconds delay_{0};
    Clock::time_point nextAttempt_{};
};

} // namespace termxfer
