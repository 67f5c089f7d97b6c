#pragma once

/**
 * @file session.h
 * @brief One live conversation: its context window and turn orchestrator
 */

#include "session/turn_orchestrator.h"
#include <atomic>
#include <memory>

namespace livetalk {
namespace session {

class Session {
public:
    /**
     * @brief Create a session seeded from the store
     *
     * Loads the unfolded turns and the context summary of the conversation;
     * a store read failure fails the creation with StoreError.
     */
    static Result<std::shared_ptr<Session>> open(const ConversationId& id,
                                                 const Config& config,
                                                 const SessionServices& services);

    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const ConversationId& id() const { return id_; }

    TurnOrchestrator& orchestrator() { return *orchestrator_; }
    std::shared_ptr<context::ContextManager> context() const { return context_; }

    /// Mark the session as used (connection attached, frame received)
    void touch();

    /// Milliseconds since the last touch or turn activity
    int64_t idle_ms() const;

    bool busy() const { return orchestrator_->busy(); }

    /// Refuse new turns if none is running; see TurnOrchestrator::close_if_idle()
    bool close_if_idle() { return orchestrator_->close_if_idle(); }

    /// Cancel the running turn and stop the worker
    void close();

private:
    Session(const ConversationId& id,
            std::shared_ptr<context::ContextManager> context,
            std::unique_ptr<TurnOrchestrator> orchestrator);

    ConversationId id_;
    std::shared_ptr<context::ContextManager> context_;
    std::unique_ptr<TurnOrchestrator> orchestrator_;
    std::atomic<int64_t> last_touch_ms_;
};

} // namespace session
} // namespace livetalk
