#include "session/events.h"

namespace livetalk {
namespace session {

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "idle";
        case TurnState::Transcribing: return "transcribing";
        case TurnState::Thinking: return "thinking";
        case TurnState::Synthesizing: return "synthesizing";
    }
    return "unknown";
}

namespace {

struct TypeName {
    const char* operator()(const events::UserMessage&) const { return "user_message"; }
    const char* operator()(const events::Transcription&) const { return "transcription"; }
    const char* operator()(const events::AssistantChunk&) const { return "assistant_chunk"; }
    const char* operator()(const events::AssistantComplete&) const { return "assistant_complete"; }
    const char* operator()(const events::Status&) const { return "status"; }
    const char* operator()(const events::AssistantAudio&) const { return "assistant_audio"; }
    const char* operator()(const events::TurnError&) const { return "error"; }
};

} // anonymous namespace

const char* event_type_name(const Event& event) {
    return std::visit(TypeName{}, event);
}

} // namespace session
} // namespace livetalk
