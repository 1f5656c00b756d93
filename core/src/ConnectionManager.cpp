// Connection manager with bounded exponential backoff. The tick thread is never blocked:
// a pending retry only compares the clock.
#include "termxfer/ConnectionManager.hpp"
#include "termxfer/Log.hpp"
#include <algorithm>

namespace termxfer {

const char* connectionStateName(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Fatal: return "fatal";
    }
    return "?";
}

ConnectionManager::ConnectionManager(std::unique_ptr<RemoteClient> client, ReconnectPolicy policy,
                                     std::string fatalError)
    : client_(std::move(client)), policy_(policy), fatalError_(std::move(fatalError)) {
    if (!client_) {
        state_ = ConnectionState::Fatal;
        if (fatalError_.empty()) fatalError_ = "No transfer backend available";
    }
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

ConnectionManager::TickResult ConnectionManager::tick(std::string& err, Clock::time_point now) {
    if (state_ == ConnectionState::Fatal) return TickResult::None;
    if (state_ == ConnectionState::Connected) {
        if (client_->isConnected()) return TickResult::None;
        refresh();
    }
    if (attempts_ > 0 && now < nextAttempt_) return TickResult::None;

    state_ = ConnectionState::Connecting;
    LOGI("connecting to %s (attempt %d)", client_->description().c_str(), attempts_ + 1);
    if (client_->connect(err)) {
        state_ = ConnectionState::Connected;
        attempts_ = 0;
        delay_ = std::chrono::milliseconds(0);
        ++connections_;
        return TickResult::Connected;
    }

    state_ = ConnectionState::Disconnected;
    ++attempts_;
    if (policy_.maxAttempts > 0 && attempts_ >= policy_.maxAttempts) {
        state_ = ConnectionState::Fatal;
        fatalError_ = "Could not connect to " + client_->description() + " after " +
                      std::to_string(attempts_) + " attempts: " + err;
        LOGE("%s", fatalError_.c_str());
        return TickResult::BecameFatal;
    }
    delay_ = attempts_ == 1 ? policy_.initialDelay : std::min(delay_ * 2, policy_.maxDelay);
    nextAttempt_ = now + delay_;
    LOGW("connection failed (%s), next attempt in %lldms", err.c_str(), (long long)delay_.count());
    return TickResult::Failed;
}

bool ConnectionManager::refresh() {
    if (state_ != ConnectionState::Connected) return false;
    if (client_->isConnected()) return true;
    LOGW("connection to %s lost", client_->description().c_str());
    client_->disconnect();
    state_ = ConnectionState::Disconnected;
    return false;
}

bool ConnectionManager::noteConnectionLost() {
    if (state_ != ConnectionState::Connected) return false;
    return !refresh();
}

void ConnectionManager::disconnect() {
    if (client_ && client_->isConnected()) client_->disconnect();
    if (state_ != ConnectionState::Fatal) state_ = ConnectionState::Disconnected;
}

} // namespace termxfer
