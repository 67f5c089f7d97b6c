#pragma once

/**
 * Scripted stand-ins for the external collaborators (completion backend,
 * whisper, Piper, persistent store) plus an event recorder. No network,
 * model files or binaries needed.
 */

#include "audio/wav_codec.h"
#include "llm/completion_client.h"
#include "session/events.h"
#include "store/turn_store.h"
#include "stt/transcriber.h"
#include "tts/synthesizer.h"
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace livetalk {
namespace testing {

/// Sleep up to ms, returning early once the token is no longer active
inline bool sleep_unless_cancelled(int ms, const CancellationToken& token) {
    auto until = Clock::now() + Duration(ms);
    while (Clock::now() < until) {
        if (!token.is_active()) return false;
        std::this_thread::sleep_for(Duration(2));
    }
    return token.is_active();
}

/// Square-wave tone at 16 kHz, WAV encoded
inline AudioBytes tone_wav(int ms = 500) {
    AudioBuffer samples(audio::ms_to_samples(ms));
    for (size_t i = 0; i < samples.size(); i++) {
        samples[i] = ((i / 18) % 2) ? 8000 : -8000;
    }
    return wav::encode(samples);
}

// =============================================================================
// Completion backend
// =============================================================================

/// How one streamed reply behaves
struct ReplyScript {
    std::vector<std::string> chunks;
    std::optional<Error> error;      ///< Returned after the chunks instead of done
    int chunk_delay_ms = 0;          ///< Before each chunk
    bool hang_after_chunks = false;  ///< Block until cancelled or expired
};

class FakeCompletionClient : public llm::ICompletionClient {
public:
    void push_reply(ReplyScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(std::move(script));
    }

    /// Used when no scripted reply is queued
    void set_default_reply(ReplyScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_reply_ = std::move(script);
    }

    void set_summary(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        summary_text_ = text;
        summary_error_.reset();
    }

    void set_summary_error(const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        summary_error_ = error;
    }

    /// Per-stream deadline measured from stream(), like a profile timeout_ms (0 = none)
    void set_stream_timeout_ms(int ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_timeout_ms_ = ms;
    }

    /// Runs inside summarize(), before it returns
    void set_summarize_hook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        summarize_hook_ = std::move(hook);
    }

    std::unique_ptr<llm::CompletionStream> stream(const ChatMessages& messages,
                                                  llm::Profile profile) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_calls_++;
        stream_requests_.push_back(messages);
        (void)profile;
        ReplyScript script = default_reply_;
        if (!replies_.empty()) {
            script = std::move(replies_.front());
            replies_.pop_front();
        }
        return std::make_unique<Stream>(std::move(script), stream_timeout_ms_);
    }

    Result<std::string> summarize(const ChatMessages& messages,
                                  const std::string& summary_prompt,
                                  const CancellationToken& token) override {
        std::function<void()> hook;
        std::optional<Error> error;
        std::string text;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            summarize_calls_++;
            summarize_requests_.push_back(messages);
            last_summary_prompt_ = summary_prompt;
            hook = summarize_hook_;
            error = summary_error_;
            text = summary_text_;
        }
        if (hook) hook();
        if (!token.is_active()) return token.to_error("Summarization");
        if (error) return *error;
        return text;
    }

    int stream_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_calls_;
    }

    int summarize_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summarize_calls_;
    }

    std::vector<ChatMessages> stream_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_requests_;
    }

    std::vector<ChatMessages> summarize_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summarize_requests_;
    }

private:
    class Stream : public llm::CompletionStream {
    public:
        Stream(ReplyScript script, int timeout_ms) : script_(std::move(script)) {
            if (timeout_ms > 0) deadline_ = Clock::now() + Duration(timeout_ms);
        }

    protected:
        Result<llm::StreamDelta> pull(const CancellationToken& parent) override {
            CancellationToken token = parent;
            if (deadline_) {
                auto left = std::chrono::duration_cast<Duration>(*deadline_ - Clock::now()).count();
                if (left <= 0) return make_timeout_error("Completion timed out");
                token = parent.with_deadline(static_cast<int>(left));
            }
            if (!token.is_active()) return token.to_error("Completion");

            if (next_ < script_.chunks.size()) {
                if (script_.chunk_delay_ms > 0 && !sleep_unless_cancelled(script_.chunk_delay_ms, token)) {
                    return token.to_error("Completion");
                }
                llm::StreamDelta delta;
                delta.content = script_.chunks[next_++];
                return delta;
            }
            if (script_.hang_after_chunks) {
                while (token.is_active()) {
                    std::this_thread::sleep_for(Duration(2));
                }
                return token.to_error("Completion");
            }
            if (script_.error) return *script_.error;

            llm::StreamDelta end;
            end.done = true;
            return end;
        }

    private:
        ReplyScript script_;
        size_t next_ = 0;
        std::optional<TimePoint> deadline_;
    };

    mutable std::mutex mutex_;
    std::deque<ReplyScript> replies_;
    ReplyScript default_reply_{{"Hello", " there."}, std::nullopt, 0, false};
    std::string summary_text_ = "The user and assistant talked.";
    std::optional<Error> summary_error_;
    std::function<void()> summarize_hook_;
    std::string last_summary_prompt_;
    int stream_timeout_ms_ = 0;
    int stream_calls_ = 0;
    int summarize_calls_ = 0;
    std::vector<ChatMessages> stream_requests_;
    std::vector<ChatMessages> summarize_requests_;
};

// =============================================================================
// Speech adapters
// =============================================================================

class FakeTranscriber : public stt::ITranscriber {
public:
    explicit FakeTranscriber(const std::string& text = "what time is it") : text_(text) {}

    void set_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ = text;
    }

    void set_error(const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
    }

    Result<Transcript> transcribe(const AudioBuffer& pcm, const CancellationToken& token) override {
        calls_++;
        if (!token.is_active()) return token.to_error("Transcription");
        std::lock_guard<std::mutex> lock(mutex_);
        last_samples_ = pcm.size();
        if (error_) return *error_;
        Transcript transcript;
        transcript.text = text_;
        transcript.confidence = 0.9f;
        return transcript;
    }

    bool is_ready() const override { return true; }

    int calls() const { return calls_.load(); }

    size_t last_samples() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_samples_;
    }

private:
    mutable std::mutex mutex_;
    std::string text_;
    std::optional<Error> error_;
    size_t last_samples_ = 0;
    std::atomic<int> calls_{0};
};

class FakeSynthesizer : public tts::ISynthesizer {
public:
    void set_error(const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
    }

    void set_delay_ms(int ms) { delay_ms_ = ms; }

    /// Deadline applied inside synthesize(), like tts.timeout_ms (0 = none)
    void set_timeout_ms(int ms) { timeout_ms_ = ms; }

    Result<AudioBytes> synthesize(const std::string& text, const CancellationToken& parent) override {
        CancellationToken token = parent.with_deadline(timeout_ms_.load());
        calls_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_text_ = text;
        }
        if (!sleep_unless_cancelled(delay_ms_.load(), token)) {
            return token.to_error("Synthesis");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) return *error_;
        return tone_wav(100);
    }

    bool is_ready() const override { return true; }

    VoidResult warmup() override { return VoidResult(); }

    int calls() const { return calls_.load(); }

    std::string last_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_text_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<Error> error_;
    std::string last_text_;
    std::atomic<int> delay_ms_{0};
    std::atomic<int> timeout_ms_{0};
    std::atomic<int> calls_{0};
};

// =============================================================================
// Store
// =============================================================================

class MemoryStore : public store::ITurnStore {
public:
    Result<std::vector<Turn>> load_recent_turns(const ConversationId& id) override {
        int delay_ms = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = read_delays_.find(id);
            if (it != read_delays_.end()) delay_ms = it->second;
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_reads_) return Error(ErrorKind::StoreError, "read failed");
        std::vector<Turn> recent;
        int64_t through = summaries_[id].summarized_through_seq;
        for (const auto& turn : turns_[id]) {
            if (turn.seq > through) recent.push_back(turn);
        }
        return recent;
    }

    Result<store::StoredSummary> load_context_summary(const ConversationId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_reads_) return Error(ErrorKind::StoreError, "read failed");
        return summaries_[id];
    }

    VoidResult save_turn(const ConversationId& id, const Turn& turn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) return Error(ErrorKind::StoreError, "write failed");
        turns_[id].push_back(turn);
        return VoidResult();
    }

    VoidResult save_context_summary(const ConversationId& id,
                                    const std::string& summary,
                                    int64_t summarized_through_seq) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) return Error(ErrorKind::StoreError, "write failed");
        summaries_[id].summary = summary;
        summaries_[id].summarized_through_seq = summarized_through_seq;
        return VoidResult();
    }

    VoidResult save_title(const ConversationId& id, const std::string& title) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) return Error(ErrorKind::StoreError, "write failed");
        titles_[id] = title;
        return VoidResult();
    }

    Result<std::string> save_audio(const ConversationId& id, int64_t seq, const AudioBytes& wav) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) return Error(ErrorKind::StoreError, "write failed");
        std::string ref = "mem://" + id + "/turn_" + std::to_string(seq) + ".wav";
        audio_[ref] = wav;
        return ref;
    }

    void seed(const ConversationId& id, const std::vector<Turn>& turns, const store::StoredSummary& summary) {
        std::lock_guard<std::mutex> lock(mutex_);
        turns_[id] = turns;
        summaries_[id] = summary;
    }

    std::vector<Turn> saved_turns(const ConversationId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return turns_[id];
    }

    store::StoredSummary saved_summary(const ConversationId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return summaries_[id];
    }

    std::optional<std::string> saved_title(const ConversationId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = titles_.find(id);
        if (it == titles_.end()) return std::nullopt;
        return it->second;
    }

    /// Make load_recent_turns(id) block for a while, as a slow disk would
    void set_read_delay_ms(const ConversationId& id, int delay_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_delays_[id] = delay_ms;
    }

    size_t audio_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return audio_.size();
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    void set_fail_reads(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_reads_ = fail;
    }

private:
    std::mutex mutex_;
    std::map<ConversationId, std::vector<Turn>> turns_;
    std::map<ConversationId, store::StoredSummary> summaries_;
    std::map<std::string, AudioBytes> audio_;
    std::map<ConversationId, std::string> titles_;
    std::map<ConversationId, int> read_delays_;
    bool fail_writes_ = false;
    bool fail_reads_ = false;
};

// =============================================================================
// Events
// =============================================================================

/// Thread-safe sink that keeps every event
class EventRecorder {
public:
    session::EventSink sink() {
        return [this](const session::Event& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        };
    }

    std::vector<session::Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    /// Wire names in emission order
    std::vector<std::string> types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& event : events_) {
            out.push_back(session::event_type_name(event));
        }
        return out;
    }

    size_t count(const std::string& type) const {
        size_t n = 0;
        for (const auto& t : types()) {
            if (t == type) n++;
        }
        return n;
    }

    /// Last error event, if any
    std::optional<session::events::TurnError> last_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (auto e = std::get_if<session::events::TurnError>(&*it)) return *e;
        }
        return std::nullopt;
    }

    std::string chunk_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string text;
        for (const auto& event : events_) {
            if (auto c = std::get_if<session::events::AssistantChunk>(&event)) text += c->content;
        }
        return text;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<session::Event> events_;
};

} // namespace testing
} // namespace livetalk
