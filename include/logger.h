#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace voxgate {

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
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output. Every message is passed
 * through redact() before it is written, so secrets and voiceprint payloads
 * never reach a sink even if a caller formats them by mistake.
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

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or INFO for anything else
     */
    static LogLevel parse_level(const std::string& name);

    /**
     * @brief Replace sensitive values with [REDACTED]
     *
     * Masks the value that follows a secret/password/token/key marker
     * (e.g. "token=abc", "secret: xyz") and any ciphertext/nonce payload.
     */
    static std::string redact(const std::string& message);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) voxgate::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) voxgate::Logger::info(msg)
#define LOG_WARN(msg) voxgate::Logger::warn(msg)
#define LOG_ERROR(msg) voxgate::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) voxgate::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_WAKE(msg) voxgate::Logger::info(std::string("[Wake] ") + (msg))
#define LOG_LISTENER(msg) voxgate::Logger::info(std::string("[Listener] ") + (msg))
#define LOG_VERIFY(msg) voxgate::Logger::info(std::string("[Verify] ") + (msg))
#define LOG_STT(msg) voxgate::Logger::info(std::string("[STT] ") + (msg))
#define LOG_ROUTER(msg) voxgate::Logger::info(std::string("[Router] ") + (msg))
#define LOG_LLM(msg) voxgate::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_GATE(msg) voxgate::Logger::info(std::string("[ToolGate] ") + (msg))
#define LOG_TRACE(attempt_id, stage, data) voxgate::Logger::info(std::string("[trace] attempt=") + std::to_string(attempt_id) + " stage=" + (stage) + " " + (data))

} // namespace voxgate
