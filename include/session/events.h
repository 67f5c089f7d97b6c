#pragma once

/**
 * @file events.h
 * @brief Semantic events a session emits toward its live connection
 *
 * Closed set; the transport matches every alternative when framing.
 */

#include "core/types.h"
#include "errors.h"
#include <functional>
#include <string>
#include <variant>

namespace livetalk {
namespace session {

/**
 * @brief Per-session turn state
 *
 * Idle -> [Transcribing ->] Thinking -> [Synthesizing ->] Idle.
 * Failure or cancellation in any state returns to Idle.
 */
enum class TurnState {
    Idle,
    Transcribing,   ///< Audio turn: speech-to-text running
    Thinking,       ///< Completion streaming
    Synthesizing    ///< Voice reply: text-to-speech running
};

const char* turn_state_name(TurnState state);

namespace events {

/// User turn appended to the context
struct UserMessage {
    Turn turn;
};

/// Recognized text of an audio turn
struct Transcription {
    std::string text;
};

/// One streamed delta of the reply
struct AssistantChunk {
    std::string content;
};

/// Assistant turn appended to the context
struct AssistantComplete {
    Turn turn;
};

/// Progress notification; carries the state just entered (never Idle)
struct Status {
    TurnState state = TurnState::Thinking;
};

/// Synthesized reply
struct AssistantAudio {
    std::string audio;          ///< Base64 of the WAV bytes
    std::string format = "wav";
};

/// Turn aborted; exactly one per failed or cancelled turn
struct TurnError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

} // namespace events

using Event = std::variant<events::UserMessage,
                           events::Transcription,
                           events::AssistantChunk,
                           events::AssistantComplete,
                           events::Status,
                           events::AssistantAudio,
                           events::TurnError>;

using EventSink = std::function<void(const Event&)>;

/// Wire name of an event ("user_message", "assistant_chunk", ...)
const char* event_type_name(const Event& event);

} // namespace session
} // namespace livetalk
