#pragma once

#include <string>
#include <memory>

namespace duplex_voice {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * A session runs capture, transport (send and receive), playback and
 * teardown on separate threads. Each worker names itself once with
 * set_thread_name() and every line it writes carries that label:
 *
 *   [INFO ] 2026-01-04 10:12:03.512 <recv> [Transport] setupComplete
 *
 * Until initialize() is called, INFO and above go to stdout/stderr
 * without decoration.
 */
class Logger {
public:
    /**
     * @param min_level Lowest level written
     * @param output_file Append log lines here as well (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /**
     * @brief Label the calling thread in subsequent log lines
     *
     * Affects only the calling thread. An empty name removes the label.
     */
    static void set_thread_name(const std::string& name);

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or INFO for unrecognized input
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void write(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) duplex_voice::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) duplex_voice::Logger::info(msg)
#define LOG_WARN(msg) duplex_voice::Logger::warn(msg)
#define LOG_ERROR(msg) duplex_voice::Logger::error(msg)

// Per-stage tags
#define LOG_CAPTURE(msg) duplex_voice::Logger::debug(std::string("[Capture] ") + (msg))
#define LOG_PLAYBACK(msg) duplex_voice::Logger::debug(std::string("[Playback] ") + (msg))
#define LOG_TRANSPORT(msg) duplex_voice::Logger::info(std::string("[Transport] ") + (msg))
#define LOG_SESSION(msg) duplex_voice::Logger::info(std::string("[Session] ") + (msg))
#define LOG_TRANSCRIPT(msg) duplex_voice::Logger::debug(std::string("[Transcript] ") + (msg))

} // namespace duplex_voice
