#include "transport/chat_connection.h"
#include "logger.h"
#include <mutex>

namespace livetalk {
namespace transport {

namespace {

/// Outbound side, shared with the session's event sink so it outlives the connection
struct Outbox {
    std::mutex mutex;
    FrameWriter writer;
    bool open = true;

    void send(const std::string& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!open) return;
        writer(frame);
    }

    /// @return Whether the outbox was open
    bool shut() {
        std::lock_guard<std::mutex> lock(mutex);
        bool was_open = open;
        open = false;
        return was_open;
    }

    bool is_open() {
        std::lock_guard<std::mutex> lock(mutex);
        return open;
    }
};

} // anonymous namespace

class ChatConnection::Impl {
public:
    Impl(std::shared_ptr<session::Session> session, FrameWriter writer)
        : session_(std::move(session))
        , outbox_(std::make_shared<Outbox>()) {
        outbox_->writer = std::move(writer);
        std::shared_ptr<Outbox> outbox = outbox_;
        subscription_ = session_->orchestrator().subscribe([outbox](const session::Event& event) {
            outbox->send(encode_event(event));
        });
        session_->touch();
        LOG_TRANSPORT("Connection opened for " + session_->id());
    }

    ~Impl() {
        close();
    }

    VoidResult on_text_frame(const std::string& text) {
        if (!outbox_->is_open()) {
            return make_cancelled_error("Connection closed");
        }
        session_->touch();

        auto frame = parse_frame(text);
        if (frame.is_error()) {
            reject(frame.error());
            return frame.error();
        }
        return dispatch(frame.value());
    }

    VoidResult on_binary_frame(const AudioBytes& bytes, bool voice) {
        if (!outbox_->is_open()) {
            return make_cancelled_error("Connection closed");
        }
        session_->touch();
        return dispatch(binary_frame(bytes, voice));
    }

    void close() {
        if (!outbox_->shut()) return;
        session_->orchestrator().unsubscribe(subscription_);
        session_->orchestrator().cancel();
        session_->touch();
        LOG_TRANSPORT("Connection closed for " + session_->id());
    }

    bool is_open() const {
        return outbox_->is_open();
    }

    const ConversationId& conversation_id() const {
        return session_->id();
    }

private:
    VoidResult dispatch(const InboundFrame& frame) {
        session::TurnOptions options;
        options.voice_output = frame.voice;

        VoidResult result;
        switch (frame.kind) {
            case InboundFrame::Kind::Cancel:
                session_->orchestrator().cancel();
                return VoidResult();
            case InboundFrame::Kind::Text:
                result = session_->orchestrator().submit_text(frame.content, options);
                break;
            case InboundFrame::Kind::Audio:
                result = session_->orchestrator().submit_audio(frame.audio, options);
                break;
        }
        if (result.is_error()) {
            reject(result.error());
        }
        return result;
    }

    /// Answer a frame that never became a turn
    void reject(const Error& error) {
        LOG_TRANSPORT("Rejected frame for " + session_->id() + ": " + error.message);
        outbox_->send(encode_event(session::events::TurnError{error.kind, error.message}));
    }

    std::shared_ptr<session::Session> session_;
    std::shared_ptr<Outbox> outbox_;
    session::SubscriptionId subscription_ = 0;
};

ChatConnection::ChatConnection(std::shared_ptr<session::Session> session, FrameWriter writer)
    : impl_(std::make_unique<Impl>(std::move(session), std::move(writer))) {}

ChatConnection::~ChatConnection() = default;

VoidResult ChatConnection::on_text_frame(const std::string& text) {
    return impl_->on_text_frame(text);
}

VoidResult ChatConnection::on_binary_frame(const AudioBytes& bytes, bool voice) {
    return impl_->on_binary_frame(bytes, voice);
}

void ChatConnection::close() {
    impl_->close();
}

bool ChatConnection::is_open() const {
    return impl_->is_open();
}

const ConversationId& ChatConnection::conversation_id() const {
    return impl_->conversation_id();
}

} // namespace transport
} // namespace livetalk
