#pragma once

/**
 * @file chat_connection.h
 * @brief One live client connection bound to a session
 *
 * Transport agnostic: the owner feeds received frames in and supplies a
 * callback that writes outbound JSON frames. Events are delivered in the
 * order the session emits them. Closing the connection (client disconnect)
 * cancels the running turn; nothing is sent after close().
 */

#include "session/session.h"
#include "transport/event_codec.h"
#include <functional>
#include <memory>

namespace livetalk {
namespace transport {

/// Writes one outbound JSON frame to the client
using FrameWriter = std::function<void(const std::string&)>;

class ChatConnection {
public:
    ChatConnection(std::shared_ptr<session::Session> session, FrameWriter writer);

    /// Closes the connection if still open
    ~ChatConnection();

    // Non-copyable
    ChatConnection(const ChatConnection&) = delete;
    ChatConnection& operator=(const ChatConnection&) = delete;

    /**
     * @brief Handle a JSON frame from the client
     *
     * Malformed frames and rejected submissions (Busy, InvalidRequest) are
     * answered with an error frame and returned.
     */
    VoidResult on_text_frame(const std::string& text);

    /// Handle a binary frame (raw WAV audio)
    VoidResult on_binary_frame(const AudioBytes& bytes, bool voice = false);

    /// Client disconnected: cancel the running turn and stop sending
    void close();

    bool is_open() const;

    const ConversationId& conversation_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transport
} // namespace livetalk
