// COBIN - Cancellation token shared between a caller and the pipeline

#pragma once

#include "errors.h"

#include <atomic>
#include <string>

namespace cobin {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    // Throws Cancelled if cancel() has been called
    void check(const std::string& stage) const {
        if (is_cancelled()) throw Cancelled(stage);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// Null-safe helpers: core stages accept an optional token
inline bool is_cancelled(const CancellationToken* token) {
    return token != nullptr && token->is_cancelled();
}

inline void check_cancelled(const CancellationToken* token, const std::string& stage) {
    if (token != nullptr) token->check(stage);
}

}  // namespace cobin
