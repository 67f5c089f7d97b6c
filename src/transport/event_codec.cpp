#include "transport/event_codec.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace livetalk {
namespace transport {

namespace {

json message_json(const Turn& turn) {
    json j;
    j["id"] = turn.seq;
    j["role"] = role_name(turn.role);
    j["content"] = turn.content;
    j["token_count"] = turn.estimated_tokens.value_or(0);
    j["created_at"] = format_timestamp(turn.created_at_ms);
    if (turn.audio_ref) {
        j["audio_path"] = *turn.audio_ref;
    }
    return j;
}

/// Builds the frame body for each event alternative
struct FrameEncoder {
    json operator()(const session::events::UserMessage& e) const {
        return {{"message", message_json(e.turn)}};
    }
    json operator()(const session::events::Transcription& e) const {
        return {{"text", e.text}};
    }
    json operator()(const session::events::AssistantChunk& e) const {
        return {{"content", e.content}};
    }
    json operator()(const session::events::AssistantComplete& e) const {
        return {{"message", message_json(e.turn)}};
    }
    json operator()(const session::events::Status& e) const {
        return {{"status", session::turn_state_name(e.state)}};
    }
    json operator()(const session::events::AssistantAudio& e) const {
        return {{"audio", e.audio}, {"format", e.format}};
    }
    json operator()(const session::events::TurnError& e) const {
        return {{"kind", error_kind_name(e.kind)}, {"message", e.message}};
    }
};

Error invalid_frame(const std::string& message) {
    return make_error(ErrorKind::InvalidRequest, message);
}

} // anonymous namespace

std::string encode_event(const session::Event& event) {
    json frame = std::visit(FrameEncoder{}, event);
    frame["type"] = session::event_type_name(event);
    // Transcripts and model output may carry broken UTF-8
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string format_timestamp(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (epoch_ms % 1000) << 'Z';
    return oss.str();
}

Result<InboundFrame> parse_frame(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception&) {
        return invalid_frame("Frame is not valid JSON");
    }
    if (!j.is_object()) {
        return invalid_frame("Frame must be a JSON object");
    }

    InboundFrame frame;
    if (j.contains("voice")) {
        if (!j["voice"].is_boolean()) {
            return invalid_frame("\"voice\" must be a boolean");
        }
        frame.voice = j["voice"].get<bool>();
    }

    std::string type = "message";
    if (j.contains("type")) {
        if (!j["type"].is_string()) {
            return invalid_frame("\"type\" must be a string");
        }
        type = j["type"].get<std::string>();
    }

    if (type == "cancel") {
        frame.kind = InboundFrame::Kind::Cancel;
        return frame;
    }

    if (type == "audio") {
        if (!j.contains("audio") || !j["audio"].is_string()) {
            return invalid_frame("Audio frame requires base64 \"audio\"");
        }
        auto decoded = utils::base64_decode(j["audio"].get<std::string>());
        if (!decoded) {
            return invalid_frame("Audio is not valid base64");
        }
        frame.kind = InboundFrame::Kind::Audio;
        frame.audio = std::move(*decoded);
        return frame;
    }

    if (type == "message") {
        if (!j.contains("content") || !j["content"].is_string()) {
            return invalid_frame("Message frame requires string \"content\"");
        }
        frame.kind = InboundFrame::Kind::Text;
        frame.content = j["content"].get<std::string>();
        return frame;
    }

    return invalid_frame("Unknown frame type: " + type);
}

InboundFrame binary_frame(const AudioBytes& bytes, bool voice) {
    InboundFrame frame;
    frame.kind = InboundFrame::Kind::Audio;
    frame.audio = bytes;
    frame.voice = voice;
    return frame;
}

} // namespace transport
} // namespace livetalk
