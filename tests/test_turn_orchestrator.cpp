/**
 * Turn state machine tests with scripted adapters: event order for text and
 * voice turns, Busy rejection, cancellation mid-stream, empty audio, backend
 * failure mid-stream, synthesis failure, persistence, compression scheduling,
 * and two conversations running side by side.
 *
 * Run from build dir: ./test_turn_orchestrator
 */

#include "context/background_compressor.h"
#include "fakes.h"
#include "session/turn_orchestrator.h"
#include "utils.h"
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace livetalk;
using namespace livetalk::testing;
using session::TurnState;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

const int WAIT_MS = 5000;

/// One conversation wired to fakes
struct Harness {
    Config config;
    FakeCompletionClient client;
    FakeTranscriber transcriber;
    FakeSynthesizer synthesizer;
    MemoryStore store;
    EventRecorder events;
    std::shared_ptr<context::ContextManager> context;
    std::unique_ptr<context::BackgroundCompressor> compressor;
    std::unique_ptr<session::TurnOrchestrator> orchestrator;

    explicit Harness(const std::string& id = "conv", bool with_compressor = false) {
        config.llm.system_prompt = "You are terse.";
        build(id, with_compressor);
    }

    void build(const std::string& id, bool with_compressor) {
        orchestrator.reset();
        context = std::make_shared<context::ContextManager>(config.context, config.llm.system_prompt,
                                                            client, id);
        if (with_compressor) {
            compressor = std::make_unique<context::BackgroundCompressor>(&store);
        }
        session::SessionServices services;
        services.client = &client;
        services.transcriber = &transcriber;
        services.synthesizer = &synthesizer;
        services.store = &store;
        services.compressor = compressor.get();
        orchestrator = std::make_unique<session::TurnOrchestrator>(id, config, services, context);
        orchestrator->subscribe(events.sink());
    }

    ~Harness() {
        orchestrator.reset();
        if (compressor) compressor->stop();
    }
};

std::vector<std::string> expected(std::initializer_list<const char*> names) {
    return std::vector<std::string>(names.begin(), names.end());
}

std::vector<TurnState> statuses(const EventRecorder& recorder) {
    std::vector<TurnState> out;
    for (const auto& event : recorder.events()) {
        if (auto status = std::get_if<session::events::Status>(&event)) out.push_back(status->state);
    }
    return out;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- Text turn: event order, context and store ---
    {
        Harness h;
        ASSERT(h.orchestrator->state() == TurnState::Idle);
        ASSERT(h.orchestrator->submit_text("  hi  ").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));

        ASSERT(h.events.types() == expected({"user_message", "status", "assistant_chunk",
                                             "assistant_chunk", "assistant_complete"}));
        ASSERT(statuses(h.events) == std::vector<TurnState>({TurnState::Thinking}));
        ASSERT(h.events.chunk_text() == "Hello there.");
        ASSERT(h.orchestrator->state() == TurnState::Idle);
        ASSERT(!h.orchestrator->busy());

        auto turns = h.context->turns();
        ASSERT(turns.size() == 2);
        ASSERT(turns[0].role == Role::User && turns[0].content == "hi" && turns[0].seq == 1);
        ASSERT(turns[1].role == Role::Assistant && turns[1].content == "Hello there." && turns[1].seq == 2);
        ASSERT(h.store.saved_turns("conv").size() == 2);

        // The model saw system prompt then the user turn
        auto requests = h.client.stream_requests();
        ASSERT(requests.size() == 1);
        ASSERT(requests[0].size() == 2);
        ASSERT(requests[0][0].role == Role::System && requests[0][0].content == "You are terse.");
        ASSERT(requests[0][1].content == "hi");

        auto events = h.events.events();
        auto complete = std::get_if<session::events::AssistantComplete>(&events.back());
        ASSERT(complete && complete->turn.seq == 2);
    }

    // --- Blank text is rejected without events ---
    {
        Harness h;
        auto blank = h.orchestrator->submit_text(" \n ");
        ASSERT(blank.is_error() && blank.error().kind == ErrorKind::InvalidRequest);
        ASSERT(h.events.types().empty());
        ASSERT(h.client.stream_calls() == 0);
    }

    // --- Busy while a turn is in flight; turns append in submission order ---
    {
        Harness h;
        h.client.push_reply({{"a", "b", "c", "d"}, std::nullopt, 40, false});
        ASSERT(h.orchestrator->submit_text("first").is_ok());
        ASSERT(h.orchestrator->busy());
        auto second = h.orchestrator->submit_text("second");
        ASSERT(second.is_error() && second.error().kind == ErrorKind::Busy);
        auto audio = h.orchestrator->submit_audio(tone_wav());
        ASSERT(audio.is_error() && audio.error().kind == ErrorKind::Busy);
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));

        ASSERT(h.context->turn_count() == 2);
        ASSERT(h.context->turns()[0].content == "first");
        ASSERT(h.client.stream_calls() == 1);
        ASSERT(h.events.count("error") == 0);

        ASSERT(h.orchestrator->submit_text("third").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        auto turns = h.context->turns();
        ASSERT(turns.size() == 4);
        ASSERT(turns[2].content == "third" && turns[2].seq == 3);
    }

    // --- Cancel after N chunks: no assistant turn, back to Idle ---
    {
        Harness h;
        h.client.push_reply({{"one ", "two ", "three "}, std::nullopt, 0, true});
        int chunks = 0;
        session::TurnOrchestrator* orchestrator = h.orchestrator.get();
        h.orchestrator->subscribe([&chunks, orchestrator](const session::Event& event) {
            if (std::holds_alternative<session::events::AssistantChunk>(event) && ++chunks == 3) {
                orchestrator->cancel();
            }
        });
        ASSERT(h.orchestrator->submit_text("tell me a story").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));

        ASSERT(chunks == 3);
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::Cancelled);
        ASSERT(h.events.count("assistant_complete") == 0);
        ASSERT(h.events.types().back() == "error");
        ASSERT(h.context->turn_count() == 1);
        ASSERT(h.context->turns()[0].role == Role::User);
        ASSERT(h.store.saved_turns("conv").size() == 1);
        ASSERT(h.orchestrator->state() == TurnState::Idle);

        // Session is usable again
        ASSERT(h.orchestrator->submit_text("again").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.context->turn_count() == 3);

        // Cancel while idle is a no-op
        h.orchestrator->cancel();
        ASSERT(h.orchestrator->state() == TurnState::Idle);
    }

    // --- Empty audio: EmptyTranscription, nothing appended ---
    {
        Harness h;
        ASSERT(h.orchestrator->submit_audio("").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.events.types() == expected({"status", "error"}));
        ASSERT(statuses(h.events) == std::vector<TurnState>({TurnState::Transcribing}));
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::EmptyTranscription);
        ASSERT(h.context->turn_count() == 0);
        ASSERT(h.client.stream_calls() == 0);

        // Silence recognized as the blank sentinel
        h.events.clear();
        h.transcriber.set_text("[BLANK_AUDIO]");
        ASSERT(h.orchestrator->submit_audio(tone_wav()).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::EmptyTranscription);
        ASSERT(h.context->turn_count() == 0);

        // Undecodable bytes
        h.events.clear();
        ASSERT(h.orchestrator->submit_audio("not audio at all").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::TranscriptionFailed);
    }

    // --- Voice turn: full event order and synthesized reply ---
    {
        Harness h;
        h.transcriber.set_text("what time is it");
        h.client.push_reply({{"It is ", "noon."}, std::nullopt, 0, false});
        session::TurnOptions voice;
        voice.voice_output = true;
        ASSERT(h.orchestrator->submit_audio(tone_wav(), voice).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));

        ASSERT(h.events.types() == expected({"status", "transcription", "user_message", "status",
                                             "assistant_chunk", "assistant_chunk", "assistant_complete",
                                             "status", "assistant_audio"}));
        ASSERT(statuses(h.events) == std::vector<TurnState>({TurnState::Transcribing, TurnState::Thinking,
                                                             TurnState::Synthesizing}));
        ASSERT(h.synthesizer.last_text() == "It is noon.");

        auto events = h.events.events();
        auto transcription = std::get_if<session::events::Transcription>(&events[1]);
        ASSERT(transcription && transcription->text == "what time is it");
        auto audio = std::get_if<session::events::AssistantAudio>(&events.back());
        ASSERT(audio && audio->format == "wav");
        if (audio) {
            auto wav_bytes = utils::base64_decode(audio->audio);
            ASSERT(wav_bytes && wav_bytes->compare(0, 4, "RIFF") == 0);
        }
        ASSERT(h.context->turn_count() == 2);
        ASSERT(h.context->turns()[0].content == "what time is it");
        ASSERT(!h.context->turns()[0].audio_ref);
    }

    // --- Text turn with voice output skips transcription ---
    {
        Harness h;
        session::TurnOptions voice;
        voice.voice_output = true;
        ASSERT(h.orchestrator->submit_text("hi", voice).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(statuses(h.events) == std::vector<TurnState>({TurnState::Thinking, TurnState::Synthesizing}));
        ASSERT(h.events.types().back() == "assistant_audio");
        ASSERT(h.transcriber.calls() == 0);
    }

    // --- Synthesis failure after the reply was committed ---
    {
        Harness h;
        h.synthesizer.set_error(Error(ErrorKind::SynthesisFailed, "piper exited with 1"));
        session::TurnOptions voice;
        voice.voice_output = true;
        ASSERT(h.orchestrator->submit_text("hi", voice).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.events.types() == expected({"user_message", "status", "assistant_chunk", "assistant_chunk",
                                             "assistant_complete", "status", "error"}));
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::SynthesisFailed);
        ASSERT(h.context->turn_count() == 2);
        ASSERT(h.orchestrator->state() == TurnState::Idle);
    }

    // --- Cancel during synthesis ---
    {
        Harness h;
        h.synthesizer.set_delay_ms(2000);
        session::TurnOrchestrator* orchestrator = h.orchestrator.get();
        h.orchestrator->subscribe([orchestrator](const session::Event& event) {
            auto status = std::get_if<session::events::Status>(&event);
            if (status && status->state == TurnState::Synthesizing) orchestrator->cancel();
        });
        session::TurnOptions voice;
        voice.voice_output = true;
        auto start = Clock::now();
        ASSERT(h.orchestrator->submit_text("hi", voice).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(ms_since(start) < 1500);
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::Cancelled);
        ASSERT(h.events.count("assistant_audio") == 0);
    }

    // --- Completion deadline: Timeout, same shape as a cancellation ---
    {
        Harness h;
        h.client.set_stream_timeout_ms(150);
        h.client.push_reply({{"one ", "two "}, std::nullopt, 0, true});
        auto start = Clock::now();
        ASSERT(h.orchestrator->submit_text("take your time").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(ms_since(start) < 2000);

        ASSERT(h.events.types() == expected({"user_message", "status", "assistant_chunk",
                                             "assistant_chunk", "error"}));
        ASSERT(h.events.count("error") == 1);
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::Timeout);
        ASSERT(h.context->turn_count() == 1);
        ASSERT(h.context->turns()[0].role == Role::User);
        ASSERT(h.store.saved_turns("conv").size() == 1);
        ASSERT(h.orchestrator->state() == TurnState::Idle);
        ASSERT(!h.orchestrator->busy());

        // The next turn runs normally
        h.client.set_stream_timeout_ms(0);
        ASSERT(h.orchestrator->submit_text("again").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.context->turn_count() == 3);
    }

    // --- Synthesis deadline: Timeout instead of audio ---
    {
        Harness h;
        h.synthesizer.set_delay_ms(2000);
        h.synthesizer.set_timeout_ms(100);
        session::TurnOptions voice;
        voice.voice_output = true;
        auto start = Clock::now();
        ASSERT(h.orchestrator->submit_text("hi", voice).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(ms_since(start) < 1500);
        ASSERT(h.events.types() == expected({"user_message", "status", "assistant_chunk", "assistant_chunk",
                                             "assistant_complete", "status", "error"}));
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::Timeout);
        ASSERT(h.events.count("assistant_audio") == 0);
        ASSERT(h.orchestrator->state() == TurnState::Idle);
    }

    // --- HTTP 500 mid-stream: BackendError, only the user turn appended ---
    {
        Harness h;
        h.client.push_reply({{"partial "}, make_backend_error(500, "Completion backend returned HTTP 500"),
                             0, false});
        ASSERT(h.orchestrator->submit_text("hello").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.events.types() == expected({"user_message", "status", "assistant_chunk", "error"}));
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::BackendError);
        ASSERT(h.context->turn_count() == 1);
        ASSERT(h.store.saved_turns("conv").size() == 1);
        ASSERT(h.orchestrator->state() == TurnState::Idle);
    }

    // --- Reasoning blocks are stripped; a reply that is only reasoning fails ---
    {
        Harness h;
        h.client.push_reply({{"<think>the user greets</think>", "Hi!"}, std::nullopt, 0, false});
        ASSERT(h.orchestrator->submit_text("hello").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.context->turns().back().content == "Hi!");

        h.events.clear();
        h.client.push_reply({{"<think>nothing to say</think>"}, std::nullopt, 0, false});
        ASSERT(h.orchestrator->submit_text("hmm").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::ProtocolError);
        ASSERT(h.context->turn_count() == 3);
    }

    // --- Next turn may be submitted as soon as the last event arrives ---
    {
        Harness h;
        session::TurnOrchestrator* orchestrator = h.orchestrator.get();
        bool resubmitted = false;
        h.orchestrator->subscribe([&resubmitted, orchestrator](const session::Event& event) {
            if (std::holds_alternative<session::events::AssistantComplete>(event) && !resubmitted) {
                resubmitted = orchestrator->submit_text("follow-up").is_ok();
            }
        });
        ASSERT(h.orchestrator->submit_text("first").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(resubmitted);
        ASSERT(h.context->turn_count() == 4);
        ASSERT(h.context->turns()[2].content == "follow-up");
    }

    // --- Store failures are logged, the turn still succeeds ---
    {
        Harness h;
        h.store.set_fail_writes(true);
        ASSERT(h.orchestrator->submit_text("hi").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.events.types().back() == "assistant_complete");
        ASSERT(h.context->turn_count() == 2);
    }

    // --- Input recordings kept when configured ---
    {
        Harness h;
        h.config.session.keep_input_audio = true;
        h.build("conv", false);
        ASSERT(h.orchestrator->submit_audio(tone_wav()).is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        auto turns = h.context->turns();
        ASSERT(turns.size() == 2);
        ASSERT(turns[0].audio_ref && *turns[0].audio_ref == "mem://conv/turn_1.wav");
        ASSERT(h.store.audio_count() == 1);
    }

    // --- Compression runs in the background after a successful turn ---
    {
        Harness h("conv", true);
        h.config.context.max_tokens = 40;
        h.config.context.keep_recent = 2;
        h.config.context.generate_title = false;
        h.build("conv", true);
        h.client.set_summary("S.");

        for (int i = 0; i < 3; i++) {
            ASSERT(h.orchestrator->submit_text("hi").is_ok());
            ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
            ASSERT(h.compressor->wait_until_idle(WAIT_MS));
        }
        ASSERT(h.client.summarize_calls() == 1);
        ASSERT(h.context->turn_count() == 2);
        ASSERT(h.context->summary() && *h.context->summary() == "S.");
        ASSERT(h.store.saved_summary("conv").summarized_through_seq == 4);

        // The next request carries the summary instead of the folded turns
        ASSERT(h.orchestrator->submit_text("more").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        auto last = h.client.stream_requests().back();
        ASSERT(last.size() == 5);
        ASSERT(last[1].content == std::string(context::SUMMARY_HEADING) + "S.");
    }

    // --- A voice turn whose synthesis fails still bounds the window ---
    {
        Harness h("conv", true);
        h.config.context.max_tokens = 40;
        h.config.context.keep_recent = 2;
        h.config.context.generate_title = false;
        h.build("conv", true);
        h.client.set_summary("S.");
        h.synthesizer.set_error(Error(ErrorKind::SynthesisFailed, "piper exited with 1"));
        session::TurnOptions voice;
        voice.voice_output = true;

        for (int i = 0; i < 3; i++) {
            ASSERT(h.orchestrator->submit_text("hi", voice).is_ok());
            ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
            ASSERT(h.compressor->wait_until_idle(WAIT_MS));
        }
        ASSERT(h.events.count("assistant_audio") == 0);
        ASSERT(h.client.summarize_calls() == 1);
        ASSERT(h.context->turn_count() == 2);
        ASSERT(h.store.saved_summary("conv").summarized_through_seq == 4);
    }

    // --- First message of a new conversation names it in the background ---
    {
        Harness h("conv", true);
        h.client.set_summary("\"Weekend plans\"\nextra line");
        ASSERT(h.orchestrator->submit_text("Let's plan the weekend").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.compressor->wait_until_idle(WAIT_MS));
        ASSERT(h.client.summarize_calls() == 1);
        auto requests = h.client.summarize_requests();
        ASSERT(requests.size() == 1 && requests[0].size() == 1);
        ASSERT(requests.size() == 1 && requests[0][0].content == "Let's plan the weekend");
        auto title = h.store.saved_title("conv");
        ASSERT(title && *title == "Weekend plans");

        // Later turns do not rename it
        ASSERT(h.orchestrator->submit_text("Saturday first").is_ok());
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.compressor->wait_until_idle(WAIT_MS));
        ASSERT(h.client.summarize_calls() == 1);

        // Title failures never reach the client
        Harness off("quiet", true);
        off.client.set_summary_error(Error(ErrorKind::BackendUnavailable, "connection refused"));
        ASSERT(off.orchestrator->submit_text("hello").is_ok());
        ASSERT(off.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(off.compressor->wait_until_idle(WAIT_MS));
        ASSERT(off.events.count("error") == 0);
        ASSERT(!off.store.saved_title("quiet"));
    }

    // --- Two conversations in parallel, no cross-talk ---
    {
        Harness a("alpha");
        Harness b("beta");
        a.client.push_reply({{"alpha ", "reply"}, std::nullopt, 30, false});
        b.client.push_reply({{"beta ", "reply"}, std::nullopt, 30, false});

        auto start = Clock::now();
        ASSERT(a.orchestrator->submit_text("from alpha").is_ok());
        ASSERT(b.orchestrator->submit_text("from beta").is_ok());
        ASSERT(a.orchestrator->busy() && b.orchestrator->busy());
        ASSERT(a.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(b.orchestrator->wait_until_idle(WAIT_MS));
        // Ran concurrently: well under the sequential 120 ms
        ASSERT(ms_since(start) < 1000);

        ASSERT(a.events.chunk_text() == "alpha reply");
        ASSERT(b.events.chunk_text() == "beta reply");
        ASSERT(a.context->turns()[0].content == "from alpha");
        ASSERT(b.context->turns()[0].content == "from beta");
        ASSERT(a.context->turns()[1].content == "alpha reply");
        ASSERT(b.context->turns()[1].content == "beta reply");
        ASSERT(a.store.saved_turns("beta").empty());
    }

    // --- Shared client across conversations ---
    {
        Config config;
        FakeCompletionClient client;
        client.set_default_reply({{"same"}, std::nullopt, 20, false});
        MemoryStore store;
        session::SessionServices services;
        services.client = &client;
        services.store = &store;

        std::vector<std::unique_ptr<session::TurnOrchestrator>> sessions;
        std::vector<std::shared_ptr<context::ContextManager>> contexts;
        for (int i = 0; i < 4; i++) {
            std::string id = "c" + std::to_string(i);
            contexts.push_back(std::make_shared<context::ContextManager>(config.context, "", client, id));
            sessions.push_back(std::make_unique<session::TurnOrchestrator>(id, config, services, contexts.back()));
        }
        for (int i = 0; i < 4; i++) {
            ASSERT(sessions[i]->submit_text("message " + std::to_string(i)).is_ok());
        }
        for (int i = 0; i < 4; i++) {
            ASSERT(sessions[i]->wait_until_idle(WAIT_MS));
            ASSERT(contexts[i]->turn_count() == 2);
            ASSERT(contexts[i]->turns()[0].content == "message " + std::to_string(i));
            ASSERT(store.saved_turns("c" + std::to_string(i)).size() == 2);
        }
        ASSERT(client.stream_calls() == 4);

        // Missing transcriber fails audio turns only
        ASSERT(sessions[0]->submit_audio(tone_wav()).is_ok());
        ASSERT(sessions[0]->wait_until_idle(WAIT_MS));
        ASSERT(contexts[0]->turn_count() == 2);
    }

    // --- Shutdown cancels the running turn and refuses new ones ---
    {
        Harness h;
        h.client.push_reply({{"never"}, std::nullopt, 0, true});
        ASSERT(h.orchestrator->submit_text("hi").is_ok());
        h.orchestrator->shutdown();
        auto error = h.events.last_error();
        ASSERT(error && error->kind == ErrorKind::Cancelled);
        auto refused = h.orchestrator->submit_text("late");
        ASSERT(refused.is_error() && refused.error().kind == ErrorKind::Cancelled);
        ASSERT(h.events.count("assistant_complete") == 0);
    }

    // --- close_if_idle leaves a running turn alone ---
    {
        Harness h;
        h.client.push_reply({{"slow"}, std::nullopt, 0, true});
        ASSERT(h.orchestrator->submit_text("hi").is_ok());
        ASSERT(!h.orchestrator->close_if_idle());
        std::this_thread::sleep_for(Duration(50));
        ASSERT(h.orchestrator->busy());
        ASSERT(!h.events.last_error());

        h.orchestrator->cancel();
        ASSERT(h.orchestrator->wait_until_idle(WAIT_MS));
        ASSERT(h.orchestrator->close_if_idle());
        ASSERT(h.orchestrator->close_if_idle());
        auto refused = h.orchestrator->submit_text("late");
        ASSERT(refused.is_error() && refused.error().kind == ErrorKind::Cancelled);
        h.orchestrator->shutdown();
        ASSERT(h.events.count("error") == 1);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All turn orchestrator tests passed.\n";
    return 0;
}
