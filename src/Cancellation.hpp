// Cancellation.hpp
// Cooperative cancellation flag shared between a scan and the work it spawns.
#pragma once

#include <atomic>
#include <chrono>

namespace Camscout {

class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }
    void reset() { m_cancelled.store(false); }

private:
    std::atomic<bool> m_cancelled{false};
};

// Null tokens are allowed everywhere and mean "never cancelled".
inline bool isCancelled(const CancellationToken* token) {
    return token != nullptr && token->isCancelled();
}

// Remaining milliseconds until deadline, clamped at zero.
inline int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace Camscout
