#pragma once

/**
 * @file turn_orchestrator.h
 * @brief Per-conversation turn state machine
 *
 * Accepts one user turn at a time and runs it on the session's worker
 * thread: transcription (audio only), context append, streamed completion,
 * synthesis (voice replies only). Progress is reported as events to every
 * subscriber, in order.
 *
 * Per turn:
 *   audio:  status{transcribing} -> transcription -> user_message
 *   both:   status{thinking} -> assistant_chunk* -> assistant_complete
 *   voice:  status{synthesizing} -> assistant_audio
 * A failure or cancellation ends the turn with one error event.
 */

#include "config.h"
#include "context/background_compressor.h"
#include "context/context_manager.h"
#include "llm/completion_client.h"
#include "session/events.h"
#include "store/turn_store.h"
#include "stt/transcriber.h"
#include "tts/synthesizer.h"
#include <memory>

namespace livetalk {
namespace session {

/**
 * @brief Process-wide collaborators shared by every session
 *
 * Owned by the caller and required to outlive the sessions. Only client
 * is mandatory; a missing transcriber or synthesizer fails the matching
 * turns, a missing store or compressor disables persistence or compression.
 */
struct SessionServices {
    llm::ICompletionClient* client = nullptr;
    stt::ITranscriber* transcriber = nullptr;
    tts::ISynthesizer* synthesizer = nullptr;
    store::ITurnStore* store = nullptr;
    context::BackgroundCompressor* compressor = nullptr;
};

struct TurnOptions {
    bool voice_output = false;   ///< Synthesize the reply
};

using SubscriptionId = uint64_t;

class TurnOrchestrator {
public:
    TurnOrchestrator(const ConversationId& conversation_id,
                     const Config& config,
                     const SessionServices& services,
                     std::shared_ptr<context::ContextManager> context);

    /// Cancels any running turn and joins the worker
    ~TurnOrchestrator();

    // Non-copyable
    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    /**
     * @brief Start a text turn
     * @return Busy while another turn runs, InvalidRequest for blank text
     */
    VoidResult submit_text(const std::string& text, const TurnOptions& options = {});

    /**
     * @brief Start an audio turn (WAV bytes)
     * @return Busy while another turn runs
     */
    VoidResult submit_audio(const AudioBytes& audio, const TurnOptions& options = {});

    /// Abort the running turn, if any (no-op when idle)
    void cancel();

    TurnState state() const;

    /// A turn is accepted and not yet finished
    bool busy() const;

    /**
     * @brief Block until no turn is running and its last event was delivered
     * @return false on timeout
     */
    bool wait_until_idle(int timeout_ms);

    SubscriptionId subscribe(EventSink sink);
    void unsubscribe(SubscriptionId id);

    /// Milliseconds since the last submission or turn completion
    int64_t idle_ms() const;

    /**
     * @brief Refuse further turns, but only if none is running or queued
     *
     * Decided under the same lock submissions take, so a turn is either
     * accepted before this returns true or rejected with Cancelled after.
     * Call shutdown() afterwards to join the worker.
     * @return Whether the orchestrator is now closed
     */
    bool close_if_idle();

    /// Cancel, stop the worker; later submissions fail with Cancelled
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace session
} // namespace livetalk
