/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "config.h"
#include "path_utils.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace livetalk {

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

ModelProfile parse_profile(const json& j, const std::string& key, ModelProfile profile) {
    if (!j.contains(key) || !j[key].is_object()) return profile;

    const auto& p = j[key];
    profile.base_url = get_or_default(p, "base_url", profile.base_url);
    profile.api_key = get_or_default(p, "api_key", profile.api_key);
    profile.model = get_or_default(p, "model", profile.model);
    profile.max_tokens = get_or_default(p, "max_tokens", profile.max_tokens);
    profile.temperature = get_or_default(p, "temperature", profile.temperature);
    profile.timeout_ms = get_or_default(p, "timeout_ms", profile.timeout_ms);
    profile.disable_thinking = get_or_default(p, "disable_thinking", profile.disable_thinking);
    return profile;
}

LLMConfig parse_llm_config(const json& j) {
    LLMConfig config;
    if (!j.contains("llm")) return config;

    const auto& llm = j["llm"];
    config.main_model = parse_profile(llm, "main_model", config.main_model);
    config.summary_model = parse_profile(llm, "summary_model", config.summary_model);
    config.system_prompt = get_or_default(llm, "system_prompt", config.system_prompt);
    config.summarizer_system_prompt =
        get_or_default(llm, "summarizer_system_prompt", config.summarizer_system_prompt);
    return config;
}

ContextConfig parse_context_config(const json& j) {
    ContextConfig config;
    if (!j.contains("context")) return config;

    const auto& ctx = j["context"];
    config.max_tokens = get_or_default(ctx, "max_tokens", config.max_tokens);
    config.compression_threshold =
        get_or_default(ctx, "compression_threshold", config.compression_threshold);
    config.keep_recent = get_or_default(ctx, "keep_recent", config.keep_recent);
    config.summary_prompt = get_or_default(ctx, "summary_prompt", config.summary_prompt);
    config.generate_title = get_or_default(ctx, "generate_title", config.generate_title);
    config.title_prompt = get_or_default(ctx, "title_prompt", config.title_prompt);
    return config;
}

STTConfig parse_stt_config(const json& j) {
    STTConfig config;
    if (!j.contains("stt")) return config;

    const auto& stt = j["stt"];
    config.model_path = expand_path(get_or_default(stt, "model_path", config.model_path));
    config.language = get_or_default(stt, "language", config.language);
    config.blank_sentinel = get_or_default(stt, "blank_sentinel", config.blank_sentinel);
    config.use_gpu = get_or_default(stt, "use_gpu", config.use_gpu);
    config.n_threads = get_or_default(stt, "n_threads", config.n_threads);
    config.timeout_ms = get_or_default(stt, "timeout_ms", config.timeout_ms);
    return config;
}

TTSConfig parse_tts_config(const json& j) {
    TTSConfig config;
    if (j.contains("tts")) {
        const auto& tts = j["tts"];
        config.voice_path = expand_path(get_or_default(tts, "voice_path", config.voice_path));
        config.piper_path = expand_path(get_or_default(tts, "piper_path", config.piper_path));
        config.espeak_data_path =
            expand_path(get_or_default(tts, "espeak_data_path", config.espeak_data_path));
        config.speaker_id = get_or_default(tts, "speaker_id", config.speaker_id);
        config.length_scale = get_or_default(tts, "length_scale", config.length_scale);
        config.output_gain = get_or_default(tts, "output_gain", config.output_gain);
        config.timeout_ms = get_or_default(tts, "timeout_ms", config.timeout_ms);
    }
    if (config.espeak_data_path.empty()) {
        config.espeak_data_path = default_espeak_data_path();
    }
    return config;
}

SessionConfig parse_session_config(const json& j) {
    SessionConfig config;
    if (!j.contains("session")) return config;

    const auto& s = j["session"];
    config.idle_timeout_ms = get_or_default(s, "idle_timeout_ms", config.idle_timeout_ms);
    config.sweep_interval_ms = get_or_default(s, "sweep_interval_ms", config.sweep_interval_ms);
    config.keep_input_audio = get_or_default(s, "keep_input_audio", config.keep_input_audio);
    return config;
}

StoreConfig parse_store_config(const json& j) {
    StoreConfig config;
    if (!j.contains("store")) return config;

    config.data_dir = expand_path(get_or_default(j["store"], "data_dir", config.data_dir));
    return config;
}

LogConfig parse_log_config(const json& j) {
    LogConfig config;
    if (!j.contains("log")) return config;

    const auto& log = j["log"];
    config.level = parse_log_level(get_or_default<std::string>(log, "level", "info"), config.level);
    config.file = expand_path(get_or_default(log, "file", config.file));
    return config;
}

Result<Config> parse_json(const json& j) {
    Config config;
    config.llm = parse_llm_config(j);
    config.context = parse_context_config(j);
    config.stt = parse_stt_config(j);
    config.tts = parse_tts_config(j);
    config.session = parse_session_config(j);
    config.store = parse_store_config(j);
    config.log = parse_log_config(j);
    return config;
}

} // anonymous namespace

// =============================================================================
// Config
// =============================================================================

Result<Config> Config::parse(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return make_error(ErrorKind::ConfigError, "Config root must be a JSON object");
        }
        auto parsed = parse_json(j);
        if (parsed.is_error()) {
            return parsed;
        }
        std::string validation_error = parsed.value().validate();
        if (!validation_error.empty()) {
            return make_error(ErrorKind::ConfigError, "Config validation failed: " + validation_error);
        }
        return parsed;
    } catch (const json::exception& e) {
        return make_error(ErrorKind::ConfigError, std::string("JSON parse error: ") + e.what());
    }
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error(ErrorKind::ConfigError, "Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_error()) {
        return result;
    }

    Config config = std::move(result.value());
    config.apply_environment();

    std::string validation_error = config.validate();
    if (!validation_error.empty()) {
        return make_error(ErrorKind::ConfigError, "Config validation failed: " + validation_error);
    }

    Logger::info("Configuration loaded from: " + path);
    return config;
}

void Config::apply_environment() {
    if (const char* v = std::getenv("LIVETALK_MAIN_API_KEY")) llm.main_model.api_key = v;
    if (const char* v = std::getenv("LIVETALK_MAIN_BASE_URL")) llm.main_model.base_url = v;
    if (const char* v = std::getenv("LIVETALK_SUMMARY_API_KEY")) llm.summary_model.api_key = v;
    if (const char* v = std::getenv("LIVETALK_SUMMARY_BASE_URL")) llm.summary_model.base_url = v;
    if (const char* v = std::getenv("LIVETALK_LOG_LEVEL")) log.level = parse_log_level(v, log.level);
}

std::string Config::validate() const {
    std::ostringstream errors;

    if (llm.main_model.base_url.empty()) {
        errors << "llm.main_model.base_url is required; ";
    }
    if (llm.summary_model.base_url.empty()) {
        errors << "llm.summary_model.base_url is required; ";
    }
    if (llm.main_model.max_tokens <= 0 || llm.summary_model.max_tokens <= 0) {
        errors << "llm max_tokens must be positive; ";
    }
    if (context.max_tokens == 0) {
        errors << "context.max_tokens must be positive; ";
    }
    if (context.compression_threshold <= 0.0 || context.compression_threshold > 1.0) {
        errors << "context.compression_threshold must be in (0, 1]; ";
    }
    if (context.summary_prompt.empty()) {
        errors << "context.summary_prompt is required; ";
    }
    if (context.generate_title && context.title_prompt.empty()) {
        errors << "context.title_prompt is required when generate_title is on; ";
    }
    if (tts.length_scale <= 0.0f) {
        errors << "tts.length_scale must be positive; ";
    }
    if (session.idle_timeout_ms <= 0 || session.sweep_interval_ms <= 0) {
        errors << "session timeouts must be positive; ";
    }

    return errors.str();
}

} // namespace livetalk
