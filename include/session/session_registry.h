#pragma once

/**
 * @file session_registry.h
 * @brief conversation id -> single live session
 *
 * At most one session (and so one turn orchestrator) exists per conversation
 * in the process. The registry mutex only guards the map; turns of different
 * conversations never wait on each other.
 */

#include "session/session.h"
#include <memory>
#include <vector>

namespace livetalk {
namespace session {

class SessionRegistry {
public:
    SessionRegistry(const Config& config, const SessionServices& services);

    /// Stops the sweeper and closes every session
    ~SessionRegistry();

    // Non-copyable
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Existing session for the id, or a new one seeded from the store
     *
     * Seeding runs outside the map lock; concurrent callers for the same id
     * wait for the first one and share its result.
     * @return InvalidRequest for a malformed id, StoreError when seeding fails
     */
    Result<std::shared_ptr<Session>> acquire(const ConversationId& id);

    /// Live session for the id, or null
    std::shared_ptr<Session> find(const ConversationId& id) const;

    /**
     * @brief Drop the session (conversation deleted); cancels its running turn
     * @return Whether a session existed
     */
    bool remove(const ConversationId& id);

    size_t size() const;

    std::vector<ConversationId> ids() const;

    /**
     * @brief Close sessions idle for longer than older_than_ms
     *
     * Busy sessions are skipped and picked up by a later sweep.
     * @return Number of evicted sessions
     */
    size_t evict_idle(int64_t older_than_ms);

    /// Sweep with session.idle_timeout_ms every session.sweep_interval_ms
    void start_sweeper();

    /// Stop the sweeper and close every session
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace session
} // namespace livetalk
