#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Defaults for everything the configuration file may override, plus the
 * few knobs that are deliberately not configurable.
 */

#include <cstddef>

namespace livetalk {
namespace constants {

// =============================================================================
// Context Window Constants
// =============================================================================

namespace context {
    /// Token budget of the context window sent to the main model
    constexpr size_t DEFAULT_MAX_TOKENS = 4096;

    /// Fraction of max tokens at which compression kicks in
    constexpr double DEFAULT_COMPRESSION_THRESHOLD = 0.8;

    /// Turns kept verbatim after a compression pass
    constexpr size_t DEFAULT_KEEP_RECENT = 4;

    /// Approximate tokens per character (for estimation)
    constexpr double TOKENS_PER_CHAR = 0.25;

    /// Per-message overhead for role and formatting
    constexpr size_t TOKENS_PER_MESSAGE = 4;

    /// Conversation titles are cut to this many characters
    constexpr size_t TITLE_MAX_CHARS = 50;
}

// =============================================================================
// LLM (Language Model) Constants
// =============================================================================

namespace llm {
    /// Default deadline for a streamed main-model reply (ms)
    constexpr int DEFAULT_MAIN_TIMEOUT_MS = 120000;

    /// Default deadline for a summarization call (ms)
    constexpr int DEFAULT_SUMMARY_TIMEOUT_MS = 60000;

    /// Connection timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 3000;

    /// Upper bound on a single wait inside a stream pull (ms); bounds cancellation latency
    constexpr int STREAM_POLL_MS = 50;

    constexpr int DEFAULT_MAIN_MAX_TOKENS = 2048;
    constexpr int DEFAULT_SUMMARY_MAX_TOKENS = 1024;

    constexpr float DEFAULT_MAIN_TEMPERATURE = 0.7f;
    constexpr float DEFAULT_SUMMARY_TEMPERATURE = 0.3f;

    /// Bytes of an error response body kept in BackendError messages
    constexpr size_t ERROR_BODY_EXCERPT = 512;
}

// =============================================================================
// STT / TTS Constants
// =============================================================================

namespace stt {
    constexpr int DEFAULT_TIMEOUT_MS = 60000;
    constexpr int DEFAULT_THREADS = 4;
}

namespace tts {
    constexpr int DEFAULT_TIMEOUT_MS = 60000;

    /// Interval at which a running Piper process is checked for exit/cancel (ms)
    constexpr int PROCESS_POLL_MS = 20;
}

// =============================================================================
// Session Constants
// =============================================================================

namespace session {
    /// Sessions untouched for this long are evicted (ms)
    constexpr int DEFAULT_IDLE_TIMEOUT_MS = 30 * 60 * 1000;

    /// How often the registry sweeps for idle sessions (ms)
    constexpr int DEFAULT_SWEEP_INTERVAL_MS = 60 * 1000;
}

} // namespace constants
} // namespace livetalk
