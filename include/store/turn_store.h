#pragma once

/**
 * @file turn_store.h
 * @brief Persistent store contract for conversation turns
 *
 * The store is the source of truth when a session is created and a
 * write-behind sink afterwards. Sessions keep working from memory when
 * a write fails.
 */

#include "core/types.h"
#include "errors.h"
#include <optional>
#include <string>
#include <vector>

namespace livetalk {
namespace store {

/// Compressed prefix of a conversation
struct StoredSummary {
    std::optional<std::string> summary;
    int64_t summarized_through_seq = 0;
};

class ITurnStore {
public:
    virtual ~ITurnStore() = default;

    /// Turns not yet folded into the context summary, oldest first
    virtual Result<std::vector<Turn>> load_recent_turns(const ConversationId& id) = 0;

    virtual Result<StoredSummary> load_context_summary(const ConversationId& id) = 0;

    virtual VoidResult save_turn(const ConversationId& id, const Turn& turn) = 0;

    virtual VoidResult save_context_summary(const ConversationId& id,
                                            const std::string& summary,
                                            int64_t summarized_through_seq) = 0;

    /// Short conversation title generated from the first user message
    virtual VoidResult save_title(const ConversationId& id, const std::string& title) = 0;

    /**
     * @brief Persist a voice turn's recording
     * @return Reference to store in Turn::audio_ref
     */
    virtual Result<std::string> save_audio(const ConversationId& id, int64_t seq, const AudioBytes& wav) = 0;
};

} // namespace store
} // namespace livetalk
