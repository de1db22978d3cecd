#pragma once

#include <atomic>

namespace utils
{

// Cooperative cancellation flag shared between a caller and a long-running operation.
// The operation polls isCancelled() at its own safe points.
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true); }

    void reset() { cancelled_.store(false); }

    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{ false };
};

inline bool isCancelled(const CancellationToken* token) { return token && token->isCancelled(); }

} // namespace utils
