#pragma once

// ============================================================
// cancel_token.hpp -- Cooperative cancellation flag
//
// Set from a signal handler, polled by the synchronizer before
// each file and by the transfer engine before each chunk.
// ============================================================

#include <atomic>

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Async-signal-safe: a lock-free atomic store
    void cancel() { flag_.store(true); }

    bool requested() const { return flag_.load(); }

    void reset() { flag_.store(false); }

private:
    std::atomic<bool> flag_{false};
};
