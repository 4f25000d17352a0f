#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace holo_oracle {

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
 * @brief Parse a level name ("debug", "info", "warn", "error")
 * @return Matching level, or INFO for unknown names
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Shared by the service thread and every session worker; one line per call,
 * never interleaved.
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

#define LOG_DEBUG(msg) holo_oracle::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) holo_oracle::Logger::info(msg)
#define LOG_WARN(msg) holo_oracle::Logger::warn(msg)
#define LOG_ERROR(msg) holo_oracle::Logger::error(msg)

// Component-specific logging macros
#define LOG_VAD(msg) holo_oracle::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_FAQ(msg) holo_oracle::Logger::info(std::string("[FAQ] ") + (msg))
#define LOG_STT(msg) holo_oracle::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) holo_oracle::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) holo_oracle::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_SESSION(id, msg) holo_oracle::Logger::info(std::string("[Session ") + (id) + "] " + (msg))
#define LOG_WS(msg) holo_oracle::Logger::info(std::string("[WS] ") + (msg))

} // namespace holo_oracle
