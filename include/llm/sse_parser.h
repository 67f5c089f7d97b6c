#pragma once

/**
 * @file sse_parser.h
 * @brief Incremental parser for OpenAI-style text/event-stream bodies
 *
 * Bytes arrive in arbitrary slices from the HTTP layer; complete events are
 * decoded as soon as their terminating blank line is seen. Each event's data
 * is either the literal [DONE] sentinel or a chat.completion.chunk JSON
 * object whose choices[0].delta.content carries the next text delta.
 */

#include "errors.h"
#include <deque>
#include <string>

namespace livetalk {
namespace llm {

class SseParser {
public:
    /**
     * @brief Consume a slice of the response body
     * @return ProtocolError on malformed JSON, BackendError on an in-band
     *         error object. Errors are sticky: later calls return the same error.
     */
    VoidResult feed(const std::string& bytes);

    /**
     * @brief Signal end of body
     *
     * Flushes a final event that lacks its blank-line terminator. A body that
     * ends without [DONE] and without any finish_reason is a ProtocolError.
     */
    VoidResult finish();

    /// Pop the next pending text delta; false when none is queued
    bool next_delta(std::string& out);

    /// [DONE] seen (or body finished cleanly) and every delta popped
    bool done() const { return done_ && deltas_.empty(); }

    /// Any finish_reason observed on a choice
    bool saw_finish_reason() const { return saw_finish_reason_; }

private:
    VoidResult process_line(std::string line);
    VoidResult dispatch();
    VoidResult fail(Error error);

    std::string buffer_;
    std::string event_data_;
    bool has_event_data_ = false;
    std::deque<std::string> deltas_;
    bool done_ = false;
    bool saw_finish_reason_ = false;
    Error error_;
};

} // namespace llm
} // namespace livetalk
