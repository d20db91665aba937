#pragma once

#include "loader/caching_loader.hpp"
#include "mux/mux_config.hpp"
#include "util/logger.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace muxcache {

/**
 * @brief Exception thrown when settings parsing fails
 */
class SettingsParseError : public std::runtime_error {
public:
    explicit SettingsParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Largest accepted ttl_seconds (100 years); keeps time_point + ttl within Clock's range
constexpr long kMaxTtlSeconds = 100L * 365 * 24 * 60 * 60;

/**
 * @brief Process-level cache settings
 *
 * JSON form (every field optional):
 *   @code
 *   {
 *     "cache_root": "${XDG_CACHE_HOME}/myapp",
 *     "ttl_seconds": 1800,
 *     "memory_cache_capacity": 50,
 *     "download_timeout_ms": 30000,
 *     "log_level": "INFO",
 *     "log_file": "/var/log/myapp/cache.log",
 *     "log_json": true
 *   }
 *   @endcode
 */
struct MuxSettings {
    std::string cache_root;           ///< Persistent store root (empty: default_cache_dir())
    long ttl_seconds;                 ///< Multiplexer memory TTL
    size_t memory_cache_capacity;     ///< Blob loader LRU capacity
    long download_timeout_ms;         ///< Per-download timeout
    LogLevel log_level;               ///< Minimum log level
    std::string log_file;             ///< Log file path (empty: console only)
    bool log_json;                    ///< JSON log lines vs. plain text

    MuxSettings()
        : ttl_seconds(30 * 60),
          memory_cache_capacity(kDefaultMemoryCacheCapacity),
          download_timeout_ms(30000),
          log_level(LogLevel::WARN),
          log_json(true) {}

    /**
     * @brief Strategy configuration for Multiplexer and MultiplexerMap
     *
     * Caches built from the same settings get separate JsonDiskCacher
     * instances over the same root directory.
     */
    MuxConfig mux_config() const;

    /**
     * @brief Blob loader configuration with a CurlFileDownloader using download_timeout_ms
     */
    LoaderConfig loader_config(const std::string& cache_id) const;

    LoggerConfig logger_config() const;

    /**
     * @brief Configure the global Logger from these settings
     */
    void apply_logging() const;
};

/**
 * @brief Parses settings from a JSON string
 *
 * String values are subject to environment variable expansion.
 *
 * @throws SettingsParseError if JSON is invalid, a field has the wrong type
 *         or a value is out of range
 */
MuxSettings parse_settings_from_string(const std::string& json_string);

/**
 * @brief Parses settings from a JSON file
 *
 * A relative cache_root or log_file is resolved against the file's directory.
 *
 * @throws SettingsParseError if the file cannot be read or parsing fails
 */
MuxSettings parse_settings_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to an
 * empty string.
 */
std::string expand_environment_variables(const std::string& value);

} // namespace muxcache
