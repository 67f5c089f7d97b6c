#pragma once

#include <string>
#include <memory>

namespace livetalk {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
 * @return Parsed level, or fallback when the name is not recognized
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output.
 * Safe for concurrent use from session workers and the compressor thread.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) livetalk::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) livetalk::Logger::info(msg)
#define LOG_WARN(msg) livetalk::Logger::warn(msg)
#define LOG_ERROR(msg) livetalk::Logger::error(msg)

// Component-specific logging macros
#define LOG_STT(msg) livetalk::Logger::info(std::string("[STT] ") + (msg))
#define LOG_TTS(msg) livetalk::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_LLM(msg) livetalk::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_CTX(msg) livetalk::Logger::info(std::string("[Context] ") + (msg))
#define LOG_SESSION(msg) livetalk::Logger::info(std::string("[Session] ") + (msg))
#define LOG_TRANSPORT(msg) livetalk::Logger::debug(std::string("[Transport] ") + (msg))
#define LOG_TRACE(conversation_id, stage, data) livetalk::Logger::info(std::string("[trace] conversation=") + (conversation_id) + " stage=" + (stage) + " " + (data))

} // namespace livetalk
