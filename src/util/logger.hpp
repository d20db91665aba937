/**
 * @file logger.hpp
 * @brief Structured logging for cache events with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Cache context on every event (cache ID, entity key)
 * - Console (stderr) and file sinks
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#pragma once

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace muxcache {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Cache hits, queued waiters, disk lookups
    INFO,    ///< Fetches, flushes, registrations
    WARN,    ///< Fallbacks to stale data, storage write failures
    ERROR    ///< Failed fetches delivered to callers
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Identifies the cache entry an event belongs to
 */
struct CacheContext {
    std::string cache_id;   ///< Registered cache identifier
    std::string key;        ///< Entity key (empty for whole-cache events)

    CacheContext() {}

    CacheContext(const std::string& id, const std::string& k)
        : cache_id(id), key(k) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::WARN),
          enable_console(true),
          enable_file(false),
          log_file_path("muxcache.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   Logger::get_instance().log_fetch_started(CacheContext("profiles", "u1"));
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a producer call
     */
    void log_fetch_started(const CacheContext& ctx);

    /**
     * @brief Log a successful producer call
     *
     * @param ctx Cache context
     * @param waiters Number of callers served by this fetch
     */
    void log_fetch_completed(const CacheContext& ctx, size_t waiters);

    /**
     * @brief Log a failed producer call whose error reaches the callers
     */
    void log_fetch_failed(const CacheContext& ctx, const std::string& error_message);

    /**
     * @brief Log a transient failure absorbed by a previously cached value
     *
     * @param ctx Cache context
     * @param error_message The producer error
     * @param from_store True if the value came from the persistent store
     */
    void log_fallback_used(
        const CacheContext& ctx,
        const std::string& error_message,
        bool from_store
    );

    /**
     * @brief Log a persistent store write
     */
    void log_flushed(const CacheContext& ctx, size_t bytes);

    /**
     * @brief Log a persistent store failure (read or write)
     */
    void log_storage_error(const CacheContext& ctx, const std::string& error_message);

    /**
     * @brief Log registry membership changes
     */
    void log_registry_event(const std::string& event, const std::string& cache_id);

    /**
     * @brief Log a blob download or disk hit
     */
    void log_download(const CacheContext& ctx, const std::string& event, const std::string& path);

    /**
     * @brief Free-form messages with arbitrary fields
     */
    void debug(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void info(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void warn(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void error(const std::string& message, const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const std::string& event, const CacheContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace muxcache
