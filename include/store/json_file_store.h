#pragma once

/**
 * @file json_file_store.h
 * @brief One JSON document per conversation under a data directory
 *
 * Layout:
 *   <data_dir>/<conversation>.turns.jsonl    append-only turn log, one JSON object per line
 *   <data_dir>/<conversation>.json           title, summary, summarized_through_seq
 *   <data_dir>/<conversation>/turn_<seq>.wav recordings of voice turns
 *
 * Turns are appended, never rewritten. The small metadata document is
 * replaced through a temp file and rename. Folded turns stay in the log
 * as history; only load_recent_turns() skips them. Each conversation has
 * its own lock, so writes for different conversations never wait on each
 * other.
 */

#include "store/turn_store.h"
#include <memory>
#include <optional>

namespace livetalk {
namespace store {

class JsonFileStore : public ITurnStore {
public:
    explicit JsonFileStore(const std::string& data_dir);
    ~JsonFileStore() override;

    // Non-copyable
    JsonFileStore(const JsonFileStore&) = delete;
    JsonFileStore& operator=(const JsonFileStore&) = delete;

    Result<std::vector<Turn>> load_recent_turns(const ConversationId& id) override;
    Result<StoredSummary> load_context_summary(const ConversationId& id) override;
    VoidResult save_turn(const ConversationId& id, const Turn& turn) override;
    VoidResult save_context_summary(const ConversationId& id,
                                    const std::string& summary,
                                    int64_t summarized_through_seq) override;
    VoidResult save_title(const ConversationId& id, const std::string& title) override;
    Result<std::string> save_audio(const ConversationId& id, int64_t seq, const AudioBytes& wav) override;

    /// Every stored turn, folded or not
    Result<std::vector<Turn>> load_all_turns(const ConversationId& id);

    /// Stored title, or nullopt before the first one was generated
    Result<std::optional<std::string>> load_title(const ConversationId& id);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Conversation ids become file names: [A-Za-z0-9_-], 1..128 chars
bool is_valid_conversation_id(const ConversationId& id);

} // namespace store
} // namespace livetalk
