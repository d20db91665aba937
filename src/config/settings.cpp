#include "config/settings.hpp"
#include "loader/file_downloader.hpp"
#include "storage/json_disk_cacher.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace muxcache {

namespace {

bool is_level_name(const std::string& name) {
    return name == "DEBUG" || name == "INFO" || name == "WARN" || name == "ERROR";
}

long long get_integer(const json& j, const char* field) {
    if (!j[field].is_number_integer()) {
        throw SettingsParseError(std::string("Field '") + field + "' must be an integer");
    }
    return j[field].get<long long>();
}

std::string resolve_relative_path(const std::string& path, const std::string& settings_file_path) {
    fs::path p(path);
    if (path.empty() || p.is_absolute()) {
        return path;
    }
    return (fs::path(settings_file_path).parent_path() / p).string();
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated "${": leave as is
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

MuxSettings parse_settings_from_string(const std::string& json_string) {
    MuxSettings settings;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw SettingsParseError("Settings must be a JSON object");
        }

        if (j.contains("cache_root")) {
            settings.cache_root = expand_environment_variables(j["cache_root"].get<std::string>());
        }

        if (j.contains("ttl_seconds")) {
            long long ttl = get_integer(j, "ttl_seconds");
            if (ttl < 0) {
                throw SettingsParseError("ttl_seconds must not be negative");
            }
            if (ttl > kMaxTtlSeconds) {
                throw SettingsParseError("ttl_seconds must not exceed " + std::to_string(kMaxTtlSeconds));
            }
            settings.ttl_seconds = static_cast<long>(ttl);
        }

        if (j.contains("memory_cache_capacity")) {
            long long capacity = get_integer(j, "memory_cache_capacity");
            if (capacity <= 0) {
                throw SettingsParseError("memory_cache_capacity must be greater than zero");
            }
            settings.memory_cache_capacity = static_cast<size_t>(capacity);
        }

        if (j.contains("download_timeout_ms")) {
            long long timeout = get_integer(j, "download_timeout_ms");
            if (timeout <= 0) {
                throw SettingsParseError("download_timeout_ms must be greater than zero");
            }
            settings.download_timeout_ms = static_cast<long>(timeout);
        }

        if (j.contains("log_level")) {
            std::string level = j["log_level"].get<std::string>();
            if (!is_level_name(level)) {
                throw SettingsParseError("Unknown log_level: " + level);
            }
            settings.log_level = string_to_level(level);
        }

        if (j.contains("log_file")) {
            settings.log_file = expand_environment_variables(j["log_file"].get<std::string>());
        }

        if (j.contains("log_json")) {
            settings.log_json = j["log_json"].get<bool>();
        }

    } catch (const json::parse_error& e) {
        throw SettingsParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw SettingsParseError(std::string("JSON type error: ") + e.what());
    }

    return settings;
}

MuxSettings parse_settings_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw SettingsParseError("Failed to open settings file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    MuxSettings settings = parse_settings_from_string(buffer.str());
    settings.cache_root = resolve_relative_path(settings.cache_root, file_path);
    settings.log_file = resolve_relative_path(settings.log_file, file_path);
    return settings;
}

MuxConfig MuxSettings::mux_config() const {
    MuxConfig config;
    config.ttl = std::chrono::seconds(ttl_seconds);
    config.cacher = std::make_shared<JsonDiskCacher>(fs::path(cache_root));
    return config;
}

LoaderConfig MuxSettings::loader_config(const std::string& cache_id) const {
    LoaderConfig config(cache_id);
    config.memory_capacity = memory_cache_capacity;
    config.root_dir = cache_root;
    config.downloader = std::make_shared<CurlFileDownloader>(download_timeout_ms);
    return config;
}

LoggerConfig MuxSettings::logger_config() const {
    LoggerConfig config;
    config.min_level = log_level;
    config.enable_file = !log_file.empty();
    if (config.enable_file) {
        config.log_file_path = log_file;
    }
    config.enable_json = log_json;
    return config;
}

void MuxSettings::apply_logging() const {
    Logger::get_instance().configure(logger_config());
}

} // namespace muxcache
