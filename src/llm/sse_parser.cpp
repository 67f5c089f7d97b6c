#include "llm/sse_parser.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace livetalk {
namespace llm {

VoidResult SseParser::feed(const std::string& bytes) {
    if (error_) return error_;
    if (done_) return VoidResult();  // trailing bytes after [DONE] are ignored

    buffer_ += bytes;
    size_t start = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = buffer_.substr(start, newline - start);
        start = newline + 1;
        auto result = process_line(std::move(line));
        if (result.is_error()) return result;
        if (done_) break;
    }
    buffer_.erase(0, start);
    return VoidResult();
}

VoidResult SseParser::finish() {
    if (error_) return error_;
    if (done_) return VoidResult();

    if (!buffer_.empty()) {
        auto result = process_line(buffer_);
        buffer_.clear();
        if (result.is_error()) return result;
    }
    if (has_event_data_) {
        auto result = dispatch();
        if (result.is_error()) return result;
    }
    if (!done_ && !saw_finish_reason_) {
        return fail(make_error(ErrorKind::ProtocolError, "Stream ended before [DONE]"));
    }
    done_ = true;
    return VoidResult();
}

bool SseParser::next_delta(std::string& out) {
    if (deltas_.empty()) return false;
    out = std::move(deltas_.front());
    deltas_.pop_front();
    return true;
}

VoidResult SseParser::process_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // Blank line terminates the event
    if (line.empty()) {
        return has_event_data_ ? dispatch() : VoidResult();
    }
    // Comment / keep-alive
    if (line[0] == ':') {
        return VoidResult();
    }

    std::string field = line;
    std::string value;
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }

    if (field == "data") {
        if (has_event_data_) event_data_ += '\n';
        event_data_ += value;
        has_event_data_ = true;
    }
    // event:, id:, retry: carry nothing we use
    return VoidResult();
}

VoidResult SseParser::dispatch() {
    std::string data = std::move(event_data_);
    event_data_.clear();
    has_event_data_ = false;

    if (data == "[DONE]") {
        done_ = true;
        return VoidResult();
    }

    try {
        json chunk = json::parse(data);
        if (!chunk.is_object()) {
            return fail(make_error(ErrorKind::ProtocolError, "Stream event is not a JSON object"));
        }

        if (chunk.contains("error")) {
            const auto& err = chunk["error"];
            std::string message = err.is_object() && err.contains("message") && err["message"].is_string()
                ? err["message"].get<std::string>()
                : err.dump();
            int status = 500;
            if (err.is_object() && err.contains("code") && err["code"].is_number_integer()) {
                status = err["code"].get<int>();
            }
            return fail(make_backend_error(status, "Backend error in stream: " + message));
        }

        if (!chunk.contains("choices") || !chunk["choices"].is_array()) {
            return fail(make_error(ErrorKind::ProtocolError, "Stream event without choices"));
        }
        // Usage-only chunks carry an empty choices array
        if (chunk["choices"].empty()) {
            return VoidResult();
        }

        const auto& choice = chunk["choices"][0];
        if (choice.contains("finish_reason") && !choice["finish_reason"].is_null()) {
            saw_finish_reason_ = true;
        }
        if (choice.contains("delta") && choice["delta"].is_object()) {
            const auto& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                std::string content = delta["content"].get<std::string>();
                if (!content.empty()) {
                    deltas_.push_back(std::move(content));
                }
            }
        }
        return VoidResult();
    } catch (const json::exception& e) {
        return fail(make_error(ErrorKind::ProtocolError,
                               std::string("Malformed stream event: ") + e.what()));
    }
}

VoidResult SseParser::fail(Error error) {
    error_ = std::move(error);
    return error_;
}

} // namespace llm
} // namespace livetalk
