#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the LiveTalk session engine
 *
 * Turns, chat messages and audio buffers are shared by every component,
 * so they live here rather than in the module that happens to create them.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <optional>

namespace livetalk {

// =============================================================================
// Audio Types
// =============================================================================

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

/// Variable-length mono PCM buffer
using AudioBuffer = std::vector<Sample>;

/// Encoded audio as received from / sent to a client (WAV container)
using AudioBytes = std::string;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock timestamp in milliseconds (for persisted turns)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Audio Format Constants
// =============================================================================

namespace audio {
    constexpr int SAMPLE_RATE = 16000;           // Hz, what whisper expects

    /// Convert milliseconds to samples
    constexpr size_t ms_to_samples(int ms) {
        return (static_cast<size_t>(ms) * SAMPLE_RATE) / 1000;
    }

    /// Convert samples to milliseconds
    constexpr int samples_to_ms(size_t samples) {
        return static_cast<int>((samples * 1000) / SAMPLE_RATE);
    }
}

// =============================================================================
// Conversation Types
// =============================================================================

/// Conversation message roles
enum class Role {
    System,
    User,
    Assistant
};

const char* role_name(Role role);

/// Parse "system" / "user" / "assistant"; unknown strings map to User
Role parse_role(const std::string& name);

/// Conversation identifier as issued by the external store
using ConversationId = std::string;

/**
 * @brief One role-tagged message of a conversation
 *
 * Immutable once appended to a context window; seq is assigned by the
 * owning ContextManager and is monotonic within a conversation.
 */
struct Turn {
    Role role = Role::User;
    std::string content;
    std::optional<size_t> estimated_tokens;
    std::optional<std::string> audio_ref;   ///< Path of the stored input recording
    int64_t seq = 0;
    int64_t created_at_ms = 0;

    static Turn user(const std::string& content);
    static Turn assistant(const std::string& content);
    static Turn system(const std::string& content);
};

/// {role, content} pair as sent to the completion backend
struct ChatMessage {
    Role role = Role::User;
    std::string content;
};

using ChatMessages = std::vector<ChatMessage>;

/// Result of speech-to-text transcription
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int token_count = 0;

    bool empty() const { return text.empty(); }
};

} // namespace livetalk
