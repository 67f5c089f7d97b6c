#pragma once

/**
 * @file event_codec.h
 * @brief JSON framing of session events and client frames
 *
 * Outbound (one JSON object per event, discriminated by "type"):
 *   user_message{message}, transcription{text}, assistant_chunk{content},
 *   assistant_complete{message}, status{status}, assistant_audio{audio, format},
 *   error{kind, message}
 *
 * Inbound:
 *   {"content": "..."}                   text turn
 *   {"type": "audio", "audio": "<b64>"}  audio turn (WAV)
 *   {"type": "cancel"}                   abort the running turn
 * Text and audio frames accept "voice": true to request a spoken reply.
 */

#include "errors.h"
#include "session/events.h"
#include <string>

namespace livetalk {
namespace transport {

/// Serialize an event to a single-line JSON frame
std::string encode_event(const session::Event& event);

/// ISO-8601 UTC timestamp with milliseconds ("2024-05-01T12:00:00.000Z")
std::string format_timestamp(int64_t epoch_ms);

struct InboundFrame {
    enum class Kind {
        Text,
        Audio,
        Cancel
    };

    Kind kind = Kind::Text;
    std::string content;   ///< Text turns
    AudioBytes audio;      ///< Audio turns, decoded
    bool voice = false;
};

/**
 * @brief Parse a text (JSON) frame from the client
 * @return Frame, or InvalidRequest for malformed input
 */
Result<InboundFrame> parse_frame(const std::string& text);

/// A raw binary frame is always an audio turn
InboundFrame binary_frame(const AudioBytes& bytes, bool voice = false);

} // namespace transport
} // namespace livetalk
