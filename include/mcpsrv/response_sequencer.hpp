#pragma once
#include "json_rpc.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace mcpsrv {

/// Releases responses in the order their requests arrived, whatever order
/// they complete in. A slot completed with nullopt emits nothing but still
/// unblocks the slots behind it.
class ResponseSequencer {
public:
    using Sink = std::function<void(const JsonRpcResponse&)>;

    explicit ResponseSequencer(Sink sink);

    /// Claim the next output slot. Call from the reader thread only.
    [[nodiscard]] uint64_t reserve();

    /// Fill a slot and flush every ready slot at the head.
    void complete(uint64_t seq, std::optional<JsonRpcResponse> response);

    /// Slots reserved but not yet released.
    [[nodiscard]] std::size_t outstanding() const;

private:
    Sink sink_;
    mutable std::mutex mutex_;
    uint64_t next_reserve_{0};
    uint64_t next_release_{0};
    std::map<uint64_t, std::optional<JsonRpcResponse>> done_;
};

} // namespace mcpsrv
