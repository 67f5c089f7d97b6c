#pragma once

/**
 * @file context_manager.h
 * @brief Bounded conversation context with summary-based compression
 *
 * Features:
 * - Ordered turn history with monotonic sequence numbers
 * - Deterministic token estimation (running total)
 * - Threshold-triggered compression of all but the K most recent turns
 * - Seeding from the persistent store on session creation
 */

#include "config.h"
#include "core/cancellation.h"
#include "core/types.h"
#include "llm/completion_client.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livetalk {
namespace context {

/// Heading of the synthetic system message that carries the summary
constexpr const char* SUMMARY_HEADING = "Summary of the earlier conversation:\n";

/**
 * @brief Estimated tokens for one message with this content
 *
 * ceil(code points * TOKENS_PER_CHAR) + TOKENS_PER_MESSAGE
 */
size_t estimate_tokens(const std::string& content);

/**
 * @brief "Summarize turns [first_seq..last_seq]" request built from a snapshot
 */
struct CompressionJob {
    int64_t first_seq = 0;
    int64_t last_seq = 0;
    size_t turn_count = 0;
    size_t folded_tokens = 0;
    ChatMessages messages;
    std::string summary_prompt;
};

/**
 * @brief Context window of one conversation
 *
 * Thread-safe. The window lock is never held across a summarization call:
 * maybe_compress() folds a snapshot and splices the result back, so turns
 * appended in the meantime survive.
 */
class ContextManager {
public:
    ContextManager(const ContextConfig& config,
                   const std::string& system_prompt,
                   llm::ICompletionClient& client,
                   const ConversationId& conversation_id = "");
    ~ContextManager();

    // Non-copyable
    ContextManager(const ContextManager&) = delete;
    ContextManager& operator=(const ContextManager&) = delete;

    // =========================================================================
    // Window
    // =========================================================================

    /**
     * @brief Messages for the next completion call
     *
     * System prompt (if configured), then the summary as a system message,
     * then every retained turn in order.
     */
    ChatMessages assemble() const;

    /**
     * @brief Append a turn, assigning its seq and token estimate
     * @return The stored turn
     */
    Turn append(Turn turn);

    /// Seed from durable state; replaces the whole window
    void restore(std::vector<Turn> turns,
                 const std::optional<std::string>& summary,
                 int64_t summarized_through_seq);

    // =========================================================================
    // Query
    // =========================================================================

    /// Summary tokens plus the tokens of every retained turn
    size_t estimated_tokens() const;

    /// estimated_tokens / max_tokens >= compression_threshold
    bool needs_compression() const;

    std::vector<Turn> turns() const;
    size_t turn_count() const;
    std::optional<std::string> summary() const;

    /// Highest seq folded into the summary (0 when none)
    int64_t summarized_through_seq() const;

    /// Highest seq assigned so far
    int64_t last_seq() const;

    bool compression_in_progress() const;

    // =========================================================================
    // Compression
    // =========================================================================

    /**
     * @brief Fold all but the K most recent turns into the summary when over threshold
     *
     * Returns false without calling the backend when under threshold, when
     * no more than K turns are retained, or when another compression of this
     * window is running. On summarization failure the window is unchanged
     * and the attempt is logged.
     *
     * @return Whether compression occurred
     */
    bool maybe_compress(const CancellationToken& token = CancellationToken());

    /**
     * @brief Short title for the conversation from its first user message
     *
     * One summary-profile call with the configured title prompt; the result
     * is trimmed to a single line of at most TITLE_MAX_CHARS characters.
     * @return The title, or the backend error (empty output is ProtocolError)
     */
    Result<std::string> generate_title(const std::string& first_message,
                                       const CancellationToken& token = CancellationToken());

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace context
} // namespace livetalk
