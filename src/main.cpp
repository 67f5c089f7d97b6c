/**
 * @file main.cpp
 * @brief Console transport: one conversation driven from stdin
 *
 * Usage: livetalk_cli [config.json] [--conversation ID] [--voice]
 *
 * Each input line becomes a text turn. Commands:
 *   /audio <file.wav>   send a recording as an audio turn
 *   /voice on|off       toggle spoken replies
 *   /cancel             abort the running turn
 *   /quit               leave
 * A line starting with '{' is sent as a raw JSON frame.
 */

#include "config.h"
#include "context/background_compressor.h"
#include "llm/openai_client.h"
#include "logger.h"
#include "path_utils.h"
#include "session/session_registry.h"
#include "store/json_file_store.h"
#include "stt/whisper_transcriber.h"
#include "transport/chat_connection.h"
#include "tts/piper_synthesizer.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace livetalk {

static std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted.store(true);
}

namespace {

struct CliOptions {
    std::string config_path = "config/livetalk.json";
    ConversationId conversation_id = "console";
    bool voice = false;
};

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--conversation" && i + 1 < argc) {
            options.conversation_id = argv[++i];
        } else if (arg == "--voice") {
            options.voice = true;
        } else {
            options.config_path = arg;
        }
    }
    return options;
}

/// Renders outbound frames for a terminal
class ConsoleWriter {
public:
    explicit ConsoleWriter(const std::string& reply_dir) : reply_dir_(reply_dir) {}

    void write(const std::string& frame_text) {
        json frame = json::parse(frame_text, nullptr, false);
        if (frame.is_discarded()) return;

        std::string type = frame.value("type", "");
        if (type == "assistant_chunk") {
            std::cout << frame.value("content", "") << std::flush;
        } else if (type == "assistant_complete") {
            std::cout << std::endl;
        } else if (type == "transcription") {
            std::cout << "you (heard): " << frame.value("text", "") << std::endl;
        } else if (type == "status") {
            std::cout << "[" << frame.value("status", "") << "]" << std::endl;
        } else if (type == "assistant_audio") {
            save_reply(frame.value("audio", ""));
        } else if (type == "error") {
            std::cout << std::endl << "error (" << frame.value("kind", "") << "): "
                      << frame.value("message", "") << std::endl;
        }
    }

private:
    void save_reply(const std::string& audio_b64) {
        auto wav = utils::base64_decode(audio_b64);
        if (!wav) {
            LOG_WARN("Reply audio is not valid base64");
            return;
        }
        std::string path = reply_dir_ + "/reply_" + std::to_string(++replies_) + ".wav";
        std::ofstream file(path, std::ios::binary);
        file.write(wav->data(), static_cast<std::streamsize>(wav->size()));
        if (!file) {
            LOG_ERROR("Failed to write " + path);
            return;
        }
        std::cout << "[audio] " << path << std::endl;
    }

    std::string reply_dir_;
    int replies_ = 0;
};

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(expand_path(path), std::ios::binary);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

/// Block until the turn is over; Ctrl-C cancels it
void wait_for_turn(session::Session& session) {
    while (!session.orchestrator().wait_until_idle(100)) {
        if (g_interrupted.exchange(false)) {
            session.orchestrator().cancel();
        }
    }
}

} // anonymous namespace

int run(const CliOptions& options) {
    auto loaded = Config::load(options.config_path);
    if (loaded.is_error()) {
        Logger::error(loaded.error().message);
        return 1;
    }
    const Config& config = loaded.value();
    if (!config.log.file.empty()) {
        // Reopen with the configured file
        Logger::shutdown();
        Logger::initialize(config.log.level, config.log.file);
    } else {
        Logger::set_level(config.log.level);
    }

    if (!ensure_directory(config.store.data_dir)) {
        Logger::error("Cannot create data directory: " + config.store.data_dir);
        return 1;
    }

    llm::OpenAIClient client(config.llm);
    store::JsonFileStore store(config.store.data_dir);
    context::BackgroundCompressor compressor(&store);

    std::unique_ptr<stt::WhisperTranscriber> transcriber;
    if (!config.stt.model_path.empty()) {
        transcriber = std::make_unique<stt::WhisperTranscriber>(config.stt);
        if (!transcriber->is_ready()) {
            LOG_WARN("Speech recognition unavailable; audio turns will fail");
        }
    }

    std::unique_ptr<tts::PiperSynthesizer> synthesizer;
    if (!config.tts.voice_path.empty()) {
        synthesizer = std::make_unique<tts::PiperSynthesizer>(config.tts);
        auto warm = synthesizer->warmup();
        if (warm.is_error()) {
            LOG_WARN("Speech synthesis unavailable: " + warm.error().message);
        }
    }

    session::SessionServices services;
    services.client = &client;
    services.transcriber = transcriber.get();
    services.synthesizer = synthesizer.get();
    services.store = &store;
    services.compressor = &compressor;

    session::SessionRegistry registry(config, services);
    registry.start_sweeper();

    auto acquired = registry.acquire(options.conversation_id);
    if (acquired.is_error()) {
        Logger::error(acquired.error().message);
        return 1;
    }
    std::shared_ptr<session::Session> session = acquired.value();

    ConsoleWriter console(config.store.data_dir);
    transport::ChatConnection connection(session, [&console](const std::string& frame) {
        console.write(frame);
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    bool voice = options.voice;
    Logger::info("Conversation '" + options.conversation_id + "' ready (" +
                 std::to_string(session->context()->turn_count()) + " turns restored). /quit to leave.");

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        g_interrupted.store(false);
        utils::trim(line);
        if (line.empty()) continue;

        if (line == "/quit") break;
        if (line == "/cancel") {
            session->orchestrator().cancel();
            continue;
        }
        if (line == "/voice on" || line == "/voice off") {
            voice = line == "/voice on";
            std::cout << "[voice " << (voice ? "on" : "off") << "]" << std::endl;
            continue;
        }

        VoidResult sent;
        if (line.rfind("/audio ", 0) == 0) {
            std::string wav;
            std::string path = utils::trim_copy(line.substr(7));
            if (!read_file(path, wav)) {
                std::cout << "cannot read " << path << std::endl;
                continue;
            }
            sent = connection.on_binary_frame(wav, voice);
        } else if (line[0] == '{') {
            sent = connection.on_text_frame(line);
        } else {
            json frame = {{"content", line}, {"voice", voice}};
            sent = connection.on_text_frame(frame.dump());
        }
        if (sent.is_ok()) {
            wait_for_turn(*session);
        }
    }

    connection.close();
    registry.stop();
    compressor.stop();
    return 0;
}

} // namespace livetalk

int main(int argc, char* argv[]) {
    livetalk::Logger::initialize(livetalk::LogLevel::INFO);

    int result = livetalk::run(livetalk::parse_args(argc, argv));

    livetalk::Logger::shutdown();
    return result;
}
