#include "mcpsrv/response_sequencer.hpp"

namespace mcpsrv {

ResponseSequencer::ResponseSequencer(Sink sink) : sink_(std::move(sink)) {}

uint64_t ResponseSequencer::reserve() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_reserve_++;
}

void ResponseSequencer::complete(uint64_t seq, std::optional<JsonRpcResponse> response) {
    // Emitting under the lock keeps sink calls ordered across threads.
    std::lock_guard<std::mutex> lock(mutex_);
    done_.emplace(seq, std::move(response));
    auto it = done_.begin();
    while (it != done_.end() && it->first == next_release_) {
        if (it->second) sink_(*it->second);
        it = done_.erase(it);
        ++next_release_;
    }
}

std::size_t ResponseSequencer::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(next_reserve_ - next_release_);
}

} // namespace mcpsrv
