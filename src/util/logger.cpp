/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "util/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace muxcache {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(
    const std::string& event,
    const CacheContext& ctx
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["cache_id"] = ctx.cache_id;
    if (!ctx.key.empty()) {
        fields["key"] = ctx.key;
    }
    return fields;
}

void Logger::log_fetch_started(const CacheContext& ctx) {
    log(LogLevel::INFO, "Fetching", context_fields("fetch_started", ctx));
}

void Logger::log_fetch_completed(const CacheContext& ctx, size_t waiters) {
    auto fields = context_fields("fetch_completed", ctx);
    fields["waiters"] = std::to_string(waiters);
    log(LogLevel::INFO, "Fetch completed", fields);
}

void Logger::log_fetch_failed(const CacheContext& ctx, const std::string& error_message) {
    auto fields = context_fields("fetch_failed", ctx);
    fields["error"] = error_message;
    log(LogLevel::ERROR, "Fetch failed", fields);
}

void Logger::log_fallback_used(
    const CacheContext& ctx,
    const std::string& error_message,
    bool from_store
) {
    auto fields = context_fields("fallback_used", ctx);
    fields["error"] = error_message;
    fields["source"] = from_store ? "store" : "memory";
    log(LogLevel::WARN, "Serving cached value after transient failure", fields);
}

void Logger::log_flushed(const CacheContext& ctx, size_t bytes) {
    auto fields = context_fields("flushed", ctx);
    fields["bytes"] = std::to_string(bytes);
    log(LogLevel::DEBUG, "Stored to persistent cache", fields);
}

void Logger::log_storage_error(const CacheContext& ctx, const std::string& error_message) {
    auto fields = context_fields("storage_error", ctx);
    fields["error"] = error_message;
    log(LogLevel::WARN, "Persistent cache error", fields);
}

void Logger::log_registry_event(const std::string& event, const std::string& cache_id) {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["cache_id"] = cache_id;
    log(LogLevel::DEBUG, "Repository " + event, fields);
}

void Logger::log_download(const CacheContext& ctx, const std::string& event, const std::string& path) {
    auto fields = context_fields(event, ctx);
    fields["path"] = path;
    log(LogLevel::INFO, event == "blob_found" ? "Memory miss, found on disk" : "Downloading", fields);
}

void Logger::debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::warn(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARN, message, fields);
}

void Logger::error(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERROR, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace muxcache
