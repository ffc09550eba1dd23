#include "mcpsrv/session.hpp"

namespace mcpsrv {

std::string_view session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Fresh:  return "fresh";
        case SessionState::Ready:  return "ready";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

Session::Session() = default;

SessionState Session::state() const {
    return state_.load(std::memory_order_acquire);
}

bool Session::is_ready() const {
    return state() == SessionState::Ready;
}

bool Session::mark_ready(const InitializeParams& params) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load(std::memory_order_acquire) == SessionState::Closed) return false;
        client_info_ = params.client_info;
        client_caps_ = params.capabilities;
        client_protocol_version_ = params.protocol_version;
    }
    SessionState expected = SessionState::Fresh;
    state_.compare_exchange_strong(expected, SessionState::Ready,
                                   std::memory_order_acq_rel);
    return state() == SessionState::Ready;
}

void Session::close() {
    state_.store(SessionState::Closed, std::memory_order_release);
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

ClientCapabilities Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

std::string Session::client_protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_protocol_version_;
}

} // namespace mcpsrv
