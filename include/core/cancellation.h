#pragma once

/**
 * @file cancellation.h
 * @brief Cooperative cancellation with per-call deadlines
 *
 * A CancellationSource is owned by whoever may abort a turn (the session).
 * Tokens handed to external calls observe both the source and an optional
 * deadline; a token derived with with_deadline() expires on its own but is
 * still cancelled when its parent is.
 */

#include "core/types.h"
#include "errors.h"
#include <atomic>
#include <memory>
#include <optional>

namespace livetalk {

enum class CancelState {
    Active,
    Cancelled,  ///< Parent source was cancelled
    Expired     ///< Deadline passed
};

class CancellationToken {
public:
    /// A token that is never cancelled and has no deadline
    CancellationToken() = default;

    CancelState state() const;

    bool is_active() const { return state() == CancelState::Active; }

    /// Derive a token that additionally expires after timeout_ms (<= 0 = no extra deadline)
    CancellationToken with_deadline(int timeout_ms) const;

    /// Milliseconds left until the deadline, or nullopt when there is none
    std::optional<int64_t> remaining_ms() const;

    /// Cancelled / Timeout error for the current state (kind None when active)
    Error to_error(const std::string& what) const;

private:
    friend class CancellationSource;

    std::shared_ptr<const std::atomic<bool>> flag_;
    std::optional<TimePoint> deadline_;
};

class CancellationSource {
public:
    CancellationSource();

    void cancel();
    bool is_cancelled() const;

    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace livetalk
