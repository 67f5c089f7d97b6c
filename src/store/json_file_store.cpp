/**
 * @file json_file_store.cpp
 * @brief File-backed turn store
 */

#include "store/json_file_store.h"
#include "logger.h"
#include "path_utils.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>
#include <unordered_map>
#include <unistd.h>

using json = nlohmann::json;

namespace livetalk {
namespace store {

bool is_valid_conversation_id(const ConversationId& id) {
    if (id.empty() || id.size() > 128) return false;
    for (unsigned char c : id) {
        if (!std::isalnum(c) && c != '_' && c != '-') return false;
    }
    return true;
}

namespace {

json turn_to_json(const Turn& turn) {
    json j;
    j["seq"] = turn.seq;
    j["role"] = role_name(turn.role);
    j["content"] = turn.content;
    j["created_at_ms"] = turn.created_at_ms;
    if (turn.estimated_tokens) {
        j["estimated_tokens"] = *turn.estimated_tokens;
    }
    if (turn.audio_ref) {
        j["audio_ref"] = *turn.audio_ref;
    }
    return j;
}

Error store_error(const std::string& message) {
    return make_error(ErrorKind::StoreError, message);
}

/// Decode one stored turn; wrongly typed or missing fields are StoreErrors
Result<Turn> json_to_turn(const json& j) {
    if (!j.is_object()) {
        return store_error("Turn entry is not an object");
    }
    try {
        Turn turn;
        turn.seq = j.at("seq").get<int64_t>();
        turn.role = parse_role(j.value("role", "user"));
        turn.content = j.value("content", "");
        turn.created_at_ms = j.value("created_at_ms", static_cast<int64_t>(0));
        if (j.contains("estimated_tokens") && j["estimated_tokens"].is_number_unsigned()) {
            turn.estimated_tokens = j["estimated_tokens"].get<size_t>();
        }
        if (j.contains("audio_ref") && j["audio_ref"].is_string()) {
            turn.audio_ref = j["audio_ref"].get<std::string>();
        }
        return turn;
    } catch (const json::exception& e) {
        return store_error(std::string("Malformed turn: ") + e.what());
    }
}

} // anonymous namespace

// =============================================================================
// JsonFileStore Implementation
// =============================================================================

class JsonFileStore::Impl {
public:
    explicit Impl(const std::string& data_dir) : data_dir_(expand_path(data_dir)) {
        LOG_INFO("Turn store: " + data_dir_);
    }

    Result<std::vector<Turn>> load_turns(const ConversationId& id, bool recent_only) {
        if (!is_valid_conversation_id(id)) {
            return store_error("Invalid conversation id: " + id);
        }
        std::lock_guard<std::mutex> lock(conversation_mutex(id));

        int64_t through = 0;
        if (recent_only) {
            auto meta = read_metadata(id);
            if (meta.is_error()) {
                return meta.error();
            }
            auto stored = summary_from(meta.value(), document_path(id));
            if (stored.is_error()) {
                return stored.error();
            }
            through = stored.value().summarized_through_seq;
        }

        std::string path = log_path(id);
        std::ifstream file(path, std::ios::binary);
        std::vector<Turn> turns;
        if (!file.is_open()) {
            return turns;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        size_t line_no = 0;
        size_t pos = 0;
        while (pos < content.size()) {
            size_t end = content.find('\n', pos);
            bool complete = end != std::string::npos;
            std::string line = content.substr(pos, complete ? end - pos : std::string::npos);
            pos = complete ? end + 1 : content.size();
            line_no++;
            if (line.empty()) continue;

            json j = json::parse(line, nullptr, false);
            if (j.is_discarded()) {
                // Torn append from a crash mid-write
                if (!complete) {
                    LOG_WARN("[Store] Ignoring incomplete last line of " + path);
                    break;
                }
                return store_error("Failed to parse " + path + " line " + std::to_string(line_no));
            }
            auto turn = json_to_turn(j);
            if (turn.is_error()) {
                return store_error(turn.error().message + " in " + path + " line " + std::to_string(line_no));
            }
            if (turn.value().seq > through) {
                turns.push_back(std::move(turn.value()));
            }
        }
        return turns;
    }

    Result<StoredSummary> load_context_summary(const ConversationId& id) {
        if (!is_valid_conversation_id(id)) {
            return store_error("Invalid conversation id: " + id);
        }
        std::lock_guard<std::mutex> lock(conversation_mutex(id));
        auto meta = read_metadata(id);
        if (meta.is_error()) {
            return meta.error();
        }
        return summary_from(meta.value(), document_path(id));
    }

    Result<std::optional<std::string>> load_title(const ConversationId& id) {
        if (!is_valid_conversation_id(id)) {
            return store_error("Invalid conversation id: " + id);
        }
        std::lock_guard<std::mutex> lock(conversation_mutex(id));
        auto meta = read_metadata(id);
        if (meta.is_error()) {
            return meta.error();
        }
        std::optional<std::string> title;
        const json& data = meta.value();
        if (data.contains("title") && data["title"].is_string()) {
            title = data["title"].get<std::string>();
        }
        return title;
    }

    VoidResult save_turn(const ConversationId& id, const Turn& turn) {
        if (!is_valid_conversation_id(id)) {
            return store_error("Invalid conversation id: " + id);
        }
        if (!ensure_directory(data_dir_)) {
            return store_error("Failed to create directory: " + data_dir_);
        }
        std::lock_guard<std::mutex> lock(conversation_mutex(id));

        std::string path = log_path(id);
        auto repaired = drop_torn_tail(path);
        if (repaired.is_error()) {
            return repaired;
        }
        std::string line = turn_to_json(turn).dump(-1, ' ', false, json::error_handler_t::replace);
        std::ofstream file(path, std::ios::binary | std::ios::app);
        if (!file.is_open()) {
            return store_error("Failed to open file for writing: " + path);
        }
        file << line << '\n';
        file.flush();
        if (!file.good()) {
            return store_error("Failed to append to " + path);
        }
        return VoidResult();
    }

    VoidResult save_context_summary(const ConversationId& id,
                                    const std::string& summary,
                                    int64_t summarized_through_seq) {
        return update_metadata(id, [&](json& data) {
            data["context_summary"] = summary;
            data["summarized_through_seq"] = summarized_through_seq;
        });
    }

    VoidResult save_title(const ConversationId& id, const std::string& title) {
        return update_metadata(id, [&](json& data) {
            data["title"] = title;
        });
    }

    Result<std::string> save_audio(const ConversationId& id, int64_t seq, const AudioBytes& wav) {
        if (!is_valid_conversation_id(id)) {
            return store_error("Invalid conversation id: " + id);
        }

        std::string dir = data_dir_ + "/" + id;
        if (!ensure_directory(dir)) {
            return store_error("Failed to create directory: " + dir);
        }

        std::string path = dir + "/turn_" + std::to_string(seq) + ".wav";
        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return store_error("Failed to open file for writing: " + path);
        }
        file.write(wav.data(), static_cast<std::streamsize>(wav.size()));
        if (!file.good()) {
            return store_error("Failed to write audio: " + path);
        }
        return path;
    }

private:
    std::string document_path(const ConversationId& id) const {
        return data_dir_ + "/" + id + ".json";
    }

    std::string log_path(const ConversationId& id) const {
        return data_dir_ + "/" + id + ".turns.jsonl";
    }

    /// One lock per conversation; the map lock is held only for the lookup
    std::mutex& conversation_mutex(const ConversationId& id) {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        auto& entry = locks_[id];
        if (!entry) {
            entry = std::make_unique<std::mutex>();
        }
        return *entry;
    }

    /// Cut a partial last line left by an interrupted append
    static VoidResult drop_torn_tail(const std::string& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open() || file.tellg() <= 0) {
            return VoidResult();
        }
        file.seekg(-1, std::ios::end);
        char last = '\n';
        file.get(last);
        if (last == '\n') {
            return VoidResult();
        }

        file.clear();
        file.seekg(0, std::ios::beg);
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        size_t keep = content.rfind('\n');
        keep = keep == std::string::npos ? 0 : keep + 1;
        if (::truncate(path.c_str(), static_cast<off_t>(keep)) != 0) {
            return store_error("Failed to repair " + path + ": " + std::strerror(errno));
        }
        LOG_WARN("[Store] Dropped incomplete last line of " + path);
        return VoidResult();
    }

    static Result<StoredSummary> summary_from(const json& data, const std::string& path) {
        StoredSummary stored;
        if (data.contains("context_summary") && data["context_summary"].is_string()) {
            stored.summary = data["context_summary"].get<std::string>();
        }
        if (data.contains("summarized_through_seq")) {
            if (!data["summarized_through_seq"].is_number_integer()) {
                return store_error("summarized_through_seq is not an integer in " + path);
            }
            stored.summarized_through_seq = data["summarized_through_seq"].get<int64_t>();
        }
        return stored;
    }

    /// Missing document reads as an empty conversation
    Result<json> read_metadata(const ConversationId& id) const {
        std::string path = document_path(id);
        std::ifstream file(path);
        if (!file.is_open()) {
            json empty;
            empty["conversation_id"] = id;
            return empty;
        }

        try {
            json data = json::parse(file);
            if (!data.is_object()) {
                return store_error("Conversation document is not an object: " + path);
            }
            return data;
        } catch (const json::exception& e) {
            return store_error("Failed to parse " + path + ": " + e.what());
        }
    }

    template <typename Mutator>
    VoidResult update_metadata(const ConversationId& id, Mutator mutate) {
        if (!is_valid_conversation_id(id)) {
            return store_error("Invalid conversation id: " + id);
        }
        std::lock_guard<std::mutex> lock(conversation_mutex(id));
        auto meta = read_metadata(id);
        if (meta.is_error()) {
            return meta.error();
        }
        json data = std::move(meta.value());
        mutate(data);
        return write_metadata(id, data);
    }

    VoidResult write_metadata(const ConversationId& id, const json& data) const {
        if (!ensure_directory(data_dir_)) {
            return store_error("Failed to create directory: " + data_dir_);
        }

        std::string path = document_path(id);
        std::string tmp_path = path + ".tmp";
        {
            std::ofstream file(tmp_path);
            if (!file.is_open()) {
                return store_error("Failed to open file for writing: " + tmp_path);
            }
            file << data.dump(2, ' ', false, json::error_handler_t::replace);
            if (!file.good()) {
                return store_error("Failed to write " + tmp_path);
            }
        }
        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            std::remove(tmp_path.c_str());
            return store_error("Failed to replace " + path);
        }
        return VoidResult();
    }

    std::string data_dir_;
    std::mutex locks_mutex_;
    std::unordered_map<ConversationId, std::unique_ptr<std::mutex>> locks_;
};

// =============================================================================
// Public Interface
// =============================================================================

JsonFileStore::JsonFileStore(const std::string& data_dir)
    : impl_(std::make_unique<Impl>(data_dir)) {}

JsonFileStore::~JsonFileStore() = default;

Result<std::vector<Turn>> JsonFileStore::load_recent_turns(const ConversationId& id) {
    return impl_->load_turns(id, true);
}

Result<std::vector<Turn>> JsonFileStore::load_all_turns(const ConversationId& id) {
    return impl_->load_turns(id, false);
}

Result<StoredSummary> JsonFileStore::load_context_summary(const ConversationId& id) {
    return impl_->load_context_summary(id);
}

VoidResult JsonFileStore::save_turn(const ConversationId& id, const Turn& turn) {
    return impl_->save_turn(id, turn);
}

VoidResult JsonFileStore::save_context_summary(const ConversationId& id,
                                               const std::string& summary,
                                               int64_t summarized_through_seq) {
    return impl_->save_context_summary(id, summary, summarized_through_seq);
}

VoidResult JsonFileStore::save_title(const ConversationId& id, const std::string& title) {
    return impl_->save_title(id, title);
}

Result<std::optional<std::string>> JsonFileStore::load_title(const ConversationId& id) {
    return impl_->load_title(id);
}

Result<std::string> JsonFileStore::save_audio(const ConversationId& id, int64_t seq, const AudioBytes& wav) {
    return impl_->save_audio(id, seq, wav);
}

} // namespace store
} // namespace livetalk
