#pragma once

/**
 * @file background_compressor.h
 * @brief Process-wide worker for summary-profile calls off the turn path
 *
 * Sessions schedule their window after every assistant turn; the worker
 * runs maybe_compress() and persists the new summary. A window already
 * waiting in the queue is not queued twice. New conversations also queue
 * a title job, which names the conversation from its first message.
 */

#include "context/context_manager.h"
#include "store/turn_store.h"
#include <memory>

namespace livetalk {
namespace context {

class BackgroundCompressor {
public:
    /// store may be null (summaries then live only in memory)
    explicit BackgroundCompressor(store::ITurnStore* store);
    ~BackgroundCompressor();

    // Non-copyable
    BackgroundCompressor(const BackgroundCompressor&) = delete;
    BackgroundCompressor& operator=(const BackgroundCompressor&) = delete;

    /**
     * @brief Queue a window for a compression check (non-blocking)
     * @return false when already queued or stopped
     */
    bool schedule(const ConversationId& conversation_id, std::shared_ptr<ContextManager> context);

    /**
     * @brief Queue title generation for a new conversation (non-blocking)
     * @return false when already queued or stopped
     */
    bool schedule_title(const ConversationId& conversation_id,
                        std::shared_ptr<ContextManager> context,
                        const std::string& first_message);

    /**
     * @brief Block until the queue is empty and no job is running
     * @return false on timeout
     */
    bool wait_until_idle(int timeout_ms);

    /// Number of completed compressions (for diagnostics)
    size_t compressions() const;

    /// Abort the running summarization, drop queued jobs and join the worker
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace context
} // namespace livetalk
