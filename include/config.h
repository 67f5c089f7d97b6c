#pragma once

/**
 * @file config.h
 * @brief Process configuration, loaded once at start and read-only afterwards
 */

#include "core/constants.h"
#include "errors.h"
#include "logger.h"
#include <string>

namespace livetalk {

/// One OpenAI-compatible completion target
struct ModelProfile {
    std::string base_url = "http://localhost:1234/v1";  ///< Without the /chat/completions suffix
    std::string api_key = "lm-studio";
    std::string model = "default";
    int max_tokens = constants::llm::DEFAULT_MAIN_MAX_TOKENS;
    float temperature = constants::llm::DEFAULT_MAIN_TEMPERATURE;
    int timeout_ms = constants::llm::DEFAULT_MAIN_TIMEOUT_MS;
    /// Ask chat-template backends (Qwen3 and friends) to skip the reasoning preamble
    bool disable_thinking = true;
};

struct LLMConfig {
    ModelProfile main_model;
    ModelProfile summary_model = [] {
        ModelProfile p;
        p.max_tokens = constants::llm::DEFAULT_SUMMARY_MAX_TOKENS;
        p.temperature = constants::llm::DEFAULT_SUMMARY_TEMPERATURE;
        p.timeout_ms = constants::llm::DEFAULT_SUMMARY_TIMEOUT_MS;
        return p;
    }();
    std::string system_prompt =
        "You are a friendly voice assistant. Answer directly without showing your reasoning. "
        "Keep replies short and natural so they read well aloud. "
        "Avoid markdown, code blocks and symbol lists unless the user asks for them.";
    /// System message used for every summarization request
    std::string summarizer_system_prompt =
        "You are an assistant that summarizes conversations concisely and accurately.";
};

struct ContextConfig {
    size_t max_tokens = constants::context::DEFAULT_MAX_TOKENS;
    double compression_threshold = constants::context::DEFAULT_COMPRESSION_THRESHOLD;
    size_t keep_recent = constants::context::DEFAULT_KEEP_RECENT;
    std::string summary_prompt =
        "Summarize the key points of the following conversation, keeping important facts, "
        "and output a concise summary:";
    /// Name a new conversation from its first user message (summary profile, background)
    bool generate_title = true;
    std::string title_prompt =
        "Write a short title (at most 20 words) for a conversation that starts with the "
        "following message. Output only the title:";
};

struct STTConfig {
    std::string model_path;
    std::string language = "en";          ///< "auto" lets whisper detect
    std::string blank_sentinel = "[BLANK_AUDIO]";
    bool use_gpu = true;
    int n_threads = constants::stt::DEFAULT_THREADS;
    int timeout_ms = constants::stt::DEFAULT_TIMEOUT_MS;
};

struct TTSConfig {
    std::string voice_path;         ///< Piper voice model (.onnx)
    std::string piper_path;         ///< Piper binary (empty = search PATH)
    std::string espeak_data_path;   ///< espeak-ng data dir (empty = platform default)
    int speaker_id = 0;
    float length_scale = 1.0f;
    float output_gain = 1.0f;
    int timeout_ms = constants::tts::DEFAULT_TIMEOUT_MS;
};

struct SessionConfig {
    int idle_timeout_ms = constants::session::DEFAULT_IDLE_TIMEOUT_MS;
    int sweep_interval_ms = constants::session::DEFAULT_SWEEP_INTERVAL_MS;
    bool keep_input_audio = false;  ///< Store voice-turn recordings and reference them from the turn
};

struct StoreConfig {
    std::string data_dir = "data/conversations";
};

struct LogConfig {
    LogLevel level = LogLevel::INFO;
    std::string file;
};

struct Config {
    LLMConfig llm;
    ContextConfig context;
    STTConfig stt;
    TTSConfig tts;
    SessionConfig session;
    StoreConfig store;
    LogConfig log;

    /**
     * @brief Load configuration from a JSON file, then apply environment overrides
     * @param path Path to JSON config file
     * @return Validated config or ConfigError
     */
    static Result<Config> load(const std::string& path);

    /**
     * @brief Parse configuration from JSON text (no environment overrides)
     */
    static Result<Config> parse(const std::string& json_text);

    /**
     * @brief Apply LIVETALK_* environment variables on top of the loaded values
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace livetalk
