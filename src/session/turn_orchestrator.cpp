#include "session/turn_orchestrator.h"
#include "logger.h"
#include "utils.h"
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

namespace livetalk {
namespace session {

class TurnOrchestrator::Impl {
public:
    Impl(const ConversationId& conversation_id,
         const Config& config,
         const SessionServices& services,
         std::shared_ptr<context::ContextManager> context)
        : conversation_id_(conversation_id)
        , config_(config)
        , services_(services)
        , context_(std::move(context))
        , last_activity_(Clock::now()) {
        worker_thread_ = std::thread(&Impl::worker_loop, this);
    }

    ~Impl() {
        shutdown();
    }

    // =========================================================================
    // Submission
    // =========================================================================

    VoidResult submit_text(const std::string& text, const TurnOptions& options) {
        std::string content = utils::trim_copy(text);
        if (content.empty()) {
            return make_error(ErrorKind::InvalidRequest, "Message content is empty");
        }
        Job job;
        job.kind = Job::Kind::Text;
        job.text = std::move(content);
        job.options = options;
        return submit(std::move(job));
    }

    VoidResult submit_audio(const AudioBytes& audio, const TurnOptions& options) {
        Job job;
        job.kind = Job::Kind::Audio;
        job.audio = audio;
        job.options = options;
        return submit(std::move(job));
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busy_) {
            LOG_SESSION("Cancelling turn in " + conversation_id_ + " (" + turn_state_name(state_) + ")");
            cancel_.cancel();
        }
    }

    TurnState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool busy() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return busy_ || in_flight_;
    }

    bool wait_until_idle(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, Duration(timeout_ms), [this] {
            return !busy_ && !in_flight_ && !pending_;
        });
    }

    int64_t idle_ms() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ms_since(last_activity_);
    }

    // =========================================================================
    // Subscribers
    // =========================================================================

    SubscriptionId subscribe(EventSink sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        SubscriptionId id = ++next_subscription_;
        sinks_[id] = std::move(sink);
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.erase(id);
    }

    bool close_if_idle() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return true;
            if (busy_ || in_flight_ || pending_) return false;
            shutdown_ = true;
        }
        job_cv_.notify_all();
        return true;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!shutdown_) {
                shutdown_ = true;
                if (busy_) cancel_.cancel();
            }
        }
        job_cv_.notify_all();
        if (worker_thread_.joinable() && worker_thread_.get_id() != std::this_thread::get_id()) {
            worker_thread_.join();
        }
    }

private:
    struct Job {
        enum class Kind { Text, Audio };
        Kind kind = Kind::Text;
        std::string text;
        AudioBytes audio;
        TurnOptions options;
        CancellationSource cancel;
    };

    VoidResult submit(Job job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return make_cancelled_error("Session closed");
            }
            if (busy_) {
                return make_error(ErrorKind::Busy, "A turn is already in progress");
            }
            busy_ = true;
            state_ = job.kind == Job::Kind::Audio ? TurnState::Transcribing : TurnState::Thinking;
            cancel_ = job.cancel;
            last_activity_ = Clock::now();
            pending_ = std::move(job);
        }
        job_cv_.notify_one();
        return VoidResult();
    }

    void worker_loop() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                job_cv_.wait(lock, [this] {
                    return shutdown_ || pending_.has_value();
                });
                // An accepted turn still runs after shutdown so it reports Cancelled
                if (!pending_) break;
                job = std::move(*pending_);
                pending_.reset();
                in_flight_ = true;
            }

            run_turn(job);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_ = false;
            }
            idle_cv_.notify_all();
        }
    }

    // =========================================================================
    // Turn pipeline
    // =========================================================================

    void run_turn(const Job& job) {
        CancellationToken token = job.cancel.token();
        auto turn_start = Clock::now();

        if (!token.is_active()) {
            fail(token.to_error("Turn"));
            return;
        }
        if (!services_.client) {
            fail(make_error(ErrorKind::BackendUnavailable, "No completion backend configured"));
            return;
        }

        std::string user_text;
        std::optional<std::string> audio_ref;

        if (job.kind == Job::Kind::Audio) {
            emit(events::Status{TurnState::Transcribing});
            if (!services_.transcriber) {
                fail(make_error(ErrorKind::TranscriptionFailed, "Speech recognition is not configured"));
                return;
            }

            auto stt_start = Clock::now();
            auto transcript = stt::transcribe_audio(*services_.transcriber, job.audio,
                                                    config_.stt.blank_sentinel, token);
            if (!token.is_active()) {
                fail(token.to_error("Turn"));
                return;
            }
            if (transcript.is_error()) {
                fail(transcript.error());
                return;
            }
            user_text = transcript.value().text;
            LOG_TRACE(conversation_id_, "stt", "ms=" + std::to_string(ms_since(stt_start)) +
                      " chars=" + std::to_string(user_text.size()));

            emit(events::Transcription{user_text});
            set_state(TurnState::Thinking);

            if (config_.session.keep_input_audio && services_.store) {
                auto saved = services_.store->save_audio(conversation_id_, context_->last_seq() + 1, job.audio);
                if (saved.is_ok()) {
                    audio_ref = saved.value();
                } else {
                    LOG_ERROR("[Session] Failed to store recording for " + conversation_id_ + ": " +
                              saved.error().message);
                }
            }
        } else {
            user_text = job.text;
        }

        Turn user_turn = Turn::user(user_text);
        user_turn.audio_ref = audio_ref;
        user_turn = context_->append(std::move(user_turn));
        persist(user_turn);
        if (user_turn.seq == 1 && config_.context.generate_title && services_.compressor) {
            services_.compressor->schedule_title(conversation_id_, context_, user_text);
        }
        emit(events::UserMessage{user_turn});
        emit(events::Status{TurnState::Thinking});

        // Completion
        auto llm_start = Clock::now();
        auto stream = services_.client->stream(context_->assemble(), llm::Profile::Main);
        size_t chunks = 0;
        while (true) {
            auto delta = stream->next(token);
            if (delta.is_error()) {
                fail(delta.error());
                return;
            }
            if (delta.value().done) break;
            if (chunks++ == 0) {
                LOG_TRACE(conversation_id_, "llm_first_token", "ms=" + std::to_string(ms_since(llm_start)));
            }
            emit(events::AssistantChunk{delta.value().content});
        }

        std::string reply = utils::strip_think_tags(stream->full_text());
        stream.reset();
        LOG_TRACE(conversation_id_, "llm", "ms=" + std::to_string(ms_since(llm_start)) +
                  " chunks=" + std::to_string(chunks));

        if (!token.is_active()) {
            fail(token.to_error("Turn"));
            return;
        }
        if (reply.empty()) {
            fail(make_error(ErrorKind::ProtocolError, "Model returned an empty reply"));
            return;
        }

        Turn assistant_turn = context_->append(Turn::assistant(reply));
        persist(assistant_turn);
        schedule_compression();

        if (!job.options.voice_output) {
            finish(events::AssistantComplete{assistant_turn});
            LOG_TRACE(conversation_id_, "turn", "ms=" + std::to_string(ms_since(turn_start)));
            return;
        }

        // Synthesis
        emit(events::AssistantComplete{assistant_turn});
        set_state(TurnState::Synthesizing);
        emit(events::Status{TurnState::Synthesizing});
        if (!services_.synthesizer) {
            fail(make_error(ErrorKind::SynthesisFailed, "Speech synthesis is not configured"));
            return;
        }

        auto tts_start = Clock::now();
        auto audio = services_.synthesizer->synthesize(reply, token);
        if (!token.is_active()) {
            fail(token.to_error("Turn"));
            return;
        }
        if (audio.is_error()) {
            fail(audio.error());
            return;
        }
        LOG_TRACE(conversation_id_, "tts", "ms=" + std::to_string(ms_since(tts_start)) +
                  " bytes=" + std::to_string(audio.value().size()));

        finish(events::AssistantAudio{utils::base64_encode(audio.value()), "wav"});
        LOG_TRACE(conversation_id_, "turn", "ms=" + std::to_string(ms_since(turn_start)));
    }

    void persist(const Turn& turn) {
        if (!services_.store) return;
        auto saved = services_.store->save_turn(conversation_id_, turn);
        if (saved.is_error()) {
            LOG_ERROR("[Session] Failed to save turn " + std::to_string(turn.seq) + " of " +
                      conversation_id_ + ": " + saved.error().message);
        }
    }

    void schedule_compression() {
        if (services_.compressor) {
            services_.compressor->schedule(conversation_id_, context_);
        }
    }

    void set_state(TurnState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }

    /// Back to Idle, then deliver the turn's last event
    void finish(Event last) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = TurnState::Idle;
            busy_ = false;
            last_activity_ = Clock::now();
        }
        emit(last);
    }

    void fail(const Error& error) {
        if (error.kind == ErrorKind::Cancelled) {
            LOG_SESSION("Turn cancelled in " + conversation_id_);
        } else {
            LOG_WARN("[Session] Turn failed in " + conversation_id_ + " (" +
                     error_kind_name(error.kind) + "): " + error.message);
        }
        finish(events::TurnError{error.kind, error.message});
    }

    void emit(const Event& event) {
        std::vector<EventSink> sinks;
        {
            std::lock_guard<std::mutex> lock(sinks_mutex_);
            sinks.reserve(sinks_.size());
            for (const auto& entry : sinks_) {
                sinks.push_back(entry.second);
            }
        }
        for (const auto& sink : sinks) {
            sink(event);
        }
    }

    ConversationId conversation_id_;
    Config config_;
    SessionServices services_;
    std::shared_ptr<context::ContextManager> context_;

    mutable std::mutex mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    TurnState state_ = TurnState::Idle;
    bool busy_ = false;       ///< Turn accepted, not yet back to Idle
    bool in_flight_ = false;  ///< Worker still delivering the turn's events
    bool shutdown_ = false;
    std::optional<Job> pending_;
    CancellationSource cancel_;
    TimePoint last_activity_;

    std::mutex sinks_mutex_;
    std::map<SubscriptionId, EventSink> sinks_;
    SubscriptionId next_subscription_ = 0;

    std::thread worker_thread_;
};

// =============================================================================
// Public Interface
// =============================================================================

TurnOrchestrator::TurnOrchestrator(const ConversationId& conversation_id,
                                   const Config& config,
                                   const SessionServices& services,
                                   std::shared_ptr<context::ContextManager> context)
    : pimpl_(std::make_unique<Impl>(conversation_id, config, services, std::move(context))) {}

TurnOrchestrator::~TurnOrchestrator() = default;

VoidResult TurnOrchestrator::submit_text(const std::string& text, const TurnOptions& options) {
    return pimpl_->submit_text(text, options);
}

VoidResult TurnOrchestrator::submit_audio(const AudioBytes& audio, const TurnOptions& options) {
    return pimpl_->submit_audio(audio, options);
}

void TurnOrchestrator::cancel() {
    pimpl_->cancel();
}

TurnState TurnOrchestrator::state() const {
    return pimpl_->state();
}

bool TurnOrchestrator::busy() const {
    return pimpl_->busy();
}

bool TurnOrchestrator::wait_until_idle(int timeout_ms) {
    return pimpl_->wait_until_idle(timeout_ms);
}

SubscriptionId TurnOrchestrator::subscribe(EventSink sink) {
    return pimpl_->subscribe(std::move(sink));
}

void TurnOrchestrator::unsubscribe(SubscriptionId id) {
    pimpl_->unsubscribe(id);
}

int64_t TurnOrchestrator::idle_ms() const {
    return pimpl_->idle_ms();
}

bool TurnOrchestrator::close_if_idle() {
    return pimpl_->close_if_idle();
}

void TurnOrchestrator::shutdown() {
    pimpl_->shutdown();
}

} // namespace session
} // namespace livetalk
