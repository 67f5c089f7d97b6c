#pragma once

/**
 * @file completion_client.h
 * @brief Chat completion interface (streaming main replies, one-shot summaries)
 */

#include "core/types.h"
#include "core/cancellation.h"
#include "errors.h"
#include <memory>
#include <string>

namespace livetalk {
namespace llm {

/// Which configured backend handles a call
enum class Profile {
    Main,
    Summary
};

const char* profile_name(Profile profile);

/// One pull from a completion stream
struct StreamDelta {
    std::string content;   ///< Text delta (empty when done)
    bool done = false;     ///< No more deltas; full_text() is final
};

/**
 * @brief Lazy, finite, non-restartable sequence of text deltas
 *
 * Nothing is sent until the first next(). Once the stream reports done or
 * an error, every later next() repeats that outcome. Destroying a stream
 * mid-way aborts the request and releases its connection.
 */
class CompletionStream {
public:
    virtual ~CompletionStream() = default;

    /**
     * @brief Block until the next delta, end of stream, or error
     *
     * Returns Cancelled / Timeout as soon as the token stops being active;
     * implementations must observe it at least every STREAM_POLL_MS.
     */
    Result<StreamDelta> next(const CancellationToken& token);

    /// Concatenation of every delta returned so far
    const std::string& full_text() const { return text_; }

    bool finished() const { return finished_; }

protected:
    virtual Result<StreamDelta> pull(const CancellationToken& token) = 0;

private:
    std::string text_;
    bool finished_ = false;
    Error error_;
};

/**
 * @brief Abstract completion backend
 */
class ICompletionClient {
public:
    virtual ~ICompletionClient() = default;

    /**
     * @brief Prepare a streamed completion; the request starts on first next()
     */
    virtual std::unique_ptr<CompletionStream> stream(const ChatMessages& messages,
                                                     Profile profile = Profile::Main) = 0;

    /**
     * @brief One non-streaming summarization call on the summary profile
     * @param messages Conversation slice to fold
     * @param summary_prompt Instruction placed before the transcript
     * @return Summary text with reasoning blocks removed
     */
    virtual Result<std::string> summarize(const ChatMessages& messages,
                                          const std::string& summary_prompt,
                                          const CancellationToken& token) = 0;
};

/**
 * @brief Render messages as "role: content" lines for a summarization prompt
 */
std::string format_transcript(const ChatMessages& messages);

} // namespace llm
} // namespace livetalk
