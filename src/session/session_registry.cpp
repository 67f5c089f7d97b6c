#include "session/session_registry.h"
#include "logger.h"
#include "store/json_file_store.h"
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace livetalk {
namespace session {

class SessionRegistry::Impl {
public:
    using OpenResult = Result<std::shared_ptr<Session>>;

    Impl(const Config& config, const SessionServices& services)
        : config_(config)
        , services_(services) {}

    ~Impl() {
        stop();
    }

    Result<std::shared_ptr<Session>> acquire(const ConversationId& id) {
        if (!store::is_valid_conversation_id(id)) {
            return make_error(ErrorKind::InvalidRequest, "Invalid conversation id");
        }

        std::promise<OpenResult> promise;
        std::shared_future<OpenResult> waiting;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return make_cancelled_error("Registry stopped");
            }
            auto it = sessions_.find(id);
            if (it != sessions_.end()) {
                it->second->touch();
                return it->second;
            }
            // Another caller is already seeding this id; share its outcome
            auto pending = opening_.find(id);
            if (pending != opening_.end()) {
                waiting = pending->second;
            } else {
                opening_[id] = promise.get_future().share();
            }
        }
        if (waiting.valid()) {
            return waiting.get();
        }

        // Store reads happen outside the map lock
        OpenResult opened = Session::open(id, config_, services_);

        std::shared_ptr<Session> orphan;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            opening_.erase(id);
            if (opened.is_ok()) {
                if (stopped_) {
                    orphan = opened.value();
                    opened = make_cancelled_error("Registry stopped");
                } else {
                    sessions_[id] = opened.value();
                    LOG_SESSION("Opened " + id + " (" + std::to_string(sessions_.size()) + " live)");
                }
            }
        }
        if (orphan) {
            orphan->close();
        }
        if (opened.is_error()) {
            LOG_ERROR("[Session] Failed to open " + id + ": " + opened.error().message);
        }
        promise.set_value(opened);
        return opened;
    }

    std::shared_ptr<Session> find(const ConversationId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        return it != sessions_.end() ? it->second : nullptr;
    }

    bool remove(const ConversationId& id) {
        std::shared_ptr<Session> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) return false;
            removed = std::move(it->second);
            sessions_.erase(it);
        }
        removed->close();
        LOG_SESSION("Removed " + id);
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    std::vector<ConversationId> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ConversationId> out;
        out.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            out.push_back(entry.first);
        }
        return out;
    }

    size_t evict_idle(int64_t older_than_ms) {
        std::vector<std::shared_ptr<Session>> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = sessions_.begin(); it != sessions_.end();) {
                const auto& session = it->second;
                // A turn accepted concurrently through a live connection keeps the session
                if (session->idle_ms() >= older_than_ms && session->close_if_idle()) {
                    evicted.push_back(session);
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        // Joined outside the map lock
        for (auto& session : evicted) {
            session->close();
            LOG_SESSION("Evicted idle session " + session->id());
        }
        return evicted.size();
    }

    void start_sweeper() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sweeper_thread_.joinable() || stopped_) return;
        sweeper_thread_ = std::thread(&Impl::sweeper_loop, this);
    }

    void stop() {
        std::unordered_map<ConversationId, std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            sessions.swap(sessions_);
        }
        sweep_cv_.notify_all();
        if (sweeper_thread_.joinable()) {
            sweeper_thread_.join();
        }
        for (auto& entry : sessions) {
            entry.second->close();
        }
    }

private:
    void sweeper_loop() {
        LOG_SESSION("Idle sweeper started (timeout " +
                    std::to_string(config_.session.idle_timeout_ms) + " ms)");
        while (true) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                sweep_cv_.wait_for(lock, Duration(config_.session.sweep_interval_ms),
                                   [this] { return stopped_; });
                if (stopped_) break;
            }
            evict_idle(config_.session.idle_timeout_ms);
        }
    }

    Config config_;
    SessionServices services_;

    mutable std::mutex mutex_;
    std::condition_variable sweep_cv_;
    std::unordered_map<ConversationId, std::shared_ptr<Session>> sessions_;
    /// Ids being seeded from the store; later callers wait on the first one's result
    std::unordered_map<ConversationId, std::shared_future<OpenResult>> opening_;
    bool stopped_ = false;
    std::thread sweeper_thread_;
};

SessionRegistry::SessionRegistry(const Config& config, const SessionServices& services)
    : impl_(std::make_unique<Impl>(config, services)) {}

SessionRegistry::~SessionRegistry() = default;

Result<std::shared_ptr<Session>> SessionRegistry::acquire(const ConversationId& id) {
    return impl_->acquire(id);
}

std::shared_ptr<Session> SessionRegistry::find(const ConversationId& id) const {
    return impl_->find(id);
}

bool SessionRegistry::remove(const ConversationId& id) {
    return impl_->remove(id);
}

size_t SessionRegistry::size() const {
    return impl_->size();
}

std::vector<ConversationId> SessionRegistry::ids() const {
    return impl_->ids();
}

size_t SessionRegistry::evict_idle(int64_t older_than_ms) {
    return impl_->evict_idle(older_than_ms);
}

void SessionRegistry::start_sweeper() {
    impl_->start_sweeper();
}

void SessionRegistry::stop() {
    impl_->stop();
}

} // namespace session
} // namespace livetalk
