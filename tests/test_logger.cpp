/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch.hpp>
#include "util/logger.hpp"
#include "test_support.hpp"
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace muxcache;
using namespace muxcache::testing;

namespace {

// Very simple JSON parser for flat log lines (test purposes only)
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

LoggerConfig file_config(const std::string& path, LogLevel level, bool json = true) {
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = json;
    return config;
}

// Restores the default configuration when a test ends
struct LoggerReset {
    ~LoggerReset() {
        LoggerConfig config;
        config.enable_console = false;
        Logger::get_instance().configure(config);
    }
};

} // namespace

TEST_CASE("Logger configuration", "[logger]") {
    LoggerReset reset;

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::WARN);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }

    SECTION("set_min_level") {
        Logger::get_instance().set_min_level(LogLevel::ERROR);
        REQUIRE(Logger::get_instance().get_min_level() == LogLevel::ERROR);
    }
}

TEST_CASE("Logger cache events", "[logger]") {
    TempDir dir;
    LoggerReset reset;
    std::string path = (dir.path() / "events.log").string();

    Logger& logger = Logger::get_instance();
    logger.configure(file_config(path, LogLevel::DEBUG));

    logger.log_fetch_completed(CacheContext("profiles", "u1"), 3);
    logger.log_fallback_used(CacheContext("profiles", "u2"), "offline", true);
    logger.log_registry_event("registered", "profiles");
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 3);

    auto completed = parse_json_log(lines[0]);
    REQUIRE(completed["event"] == "fetch_completed");
    REQUIRE(completed["cache_id"] == "profiles");
    REQUIRE(completed["key"] == "u1");
    REQUIRE(completed["waiters"] == "3");
    REQUIRE(completed["level"] == "INFO");
    REQUIRE_FALSE(completed["timestamp"].empty());

    auto fallback = parse_json_log(lines[1]);
    REQUIRE(fallback["event"] == "fallback_used");
    REQUIRE(fallback["source"] == "store");
    REQUIRE(fallback["level"] == "WARN");

    auto registered = parse_json_log(lines[2]);
    REQUIRE(registered["event"] == "registered");
}

TEST_CASE("Logger level filtering", "[logger]") {
    TempDir dir;
    LoggerReset reset;
    std::string path = (dir.path() / "filtered.log").string();

    Logger& logger = Logger::get_instance();
    logger.configure(file_config(path, LogLevel::WARN));

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown", {{"cache_id", "profiles"}});
    logger.log_fetch_failed(CacheContext("profiles", "u1"), "HTTP 500");
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(parse_json_log(lines[0])["message"] == "shown");
    REQUIRE(parse_json_log(lines[1])["event"] == "fetch_failed");
}

TEST_CASE("Logger plain text output", "[logger]") {
    TempDir dir;
    LoggerReset reset;
    std::string path = (dir.path() / "plain.log").string();

    Logger& logger = Logger::get_instance();
    logger.configure(file_config(path, LogLevel::DEBUG, false));

    logger.log_flushed(CacheContext("settings", ""), 42);
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[DEBUG]") != std::string::npos);
    REQUIRE(lines[0].find("bytes=42") != std::string::npos);
    REQUIRE(lines[0].find("cache_id=settings") != std::string::npos);
}

TEST_CASE("Logger escapes JSON strings", "[logger]") {
    TempDir dir;
    LoggerReset reset;
    std::string path = (dir.path() / "escaped.log").string();

    Logger& logger = Logger::get_instance();
    logger.configure(file_config(path, LogLevel::DEBUG));

    logger.error("quote \" and\nnewline");
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("quote \\\" and\\nnewline") != std::string::npos);
}
