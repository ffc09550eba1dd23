#pragma once
#include "types.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpsrv {

enum class SessionState {
    Fresh,   // no successful initialize yet
    Ready,   // initialize succeeded
    Closed   // transport ended
};

std::string_view session_state_name(SessionState state);

/// Per-connection lifecycle. The state only moves forward
/// (Fresh -> Ready -> Closed) and is readable without locking.
class Session {
public:
    Session();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_ready() const;

    /// Record the client's handshake and move to Ready. Repeated
    /// initialize calls refresh the client data. Returns false if the
    /// session is already closed.
    bool mark_ready(const InitializeParams& params);

    void close();

    [[nodiscard]] std::optional<Implementation> client_info() const;
    [[nodiscard]] ClientCapabilities client_capabilities() const;
    [[nodiscard]] std::string client_protocol_version() const;

private:
    std::atomic<SessionState> state_{SessionState::Fresh};

    mutable std::mutex mutex_;
    std::optional<Implementation> client_info_;
    ClientCapabilities client_caps_;
    std::string client_protocol_version_;
};

} // namespace mcpsrv
