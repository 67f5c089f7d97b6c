#include "llm/completion_client.h"

namespace livetalk {
namespace llm {

const char* profile_name(Profile profile) {
    switch (profile) {
        case Profile::Main: return "main";
        case Profile::Summary: return "summary";
    }
    return "unknown";
}

Result<StreamDelta> CompletionStream::next(const CancellationToken& token) {
    if (error_) {
        return error_;
    }
    if (finished_) {
        StreamDelta end;
        end.done = true;
        return end;
    }

    auto result = pull(token);
    if (result.is_error()) {
        error_ = result.error();
        return result;
    }
    if (result.value().done) {
        finished_ = true;
    } else {
        text_ += result.value().content;
    }
    return result;
}

std::string format_transcript(const ChatMessages& messages) {
    std::string out;
    for (const auto& message : messages) {
        if (!out.empty()) out += '\n';
        out += role_name(message.role);
        out += ": ";
        out += message.content;
    }
    return out;
}

} // namespace llm
} // namespace livetalk
