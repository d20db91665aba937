/**
 * @file test_support.hpp
 * @brief Shared fixtures: controllable producers, fake clock, temp dirs
 */

#pragma once

#include "core/clock.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "storage/cacher.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace muxcache {
namespace testing {

struct Profile {
    std::string id;
    std::string name;

    bool operator==(const Profile& other) const {
        return id == other.id && name == other.name;
    }
};

inline void to_json(nlohmann::json& j, const Profile& p) {
    j = nlohmann::json{{"id", p.id}, {"name", p.name}};
}

inline void from_json(const nlohmann::json& j, Profile& p) {
    j.at("id").get_to(p.id);
    j.at("name").get_to(p.name);
}

/**
 * Producer whose completions are resolved by the test
 */
template <typename T>
class ManualProducer {
public:
    void operator()(Completion<T> done) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_++;
        pending_.push_back(std::move(done));
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    void succeed(T value) { resolve(Result<T>::success(std::move(value))); }

    template <typename E>
    void fail(const E& error) { resolve(Result<T>::failure(error)); }

    // Completes the oldest outstanding call
    void resolve(const Result<T>& result) {
        Completion<T> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done = std::move(pending_.front());
            pending_.erase(pending_.begin());
        }
        done(result);
    }

private:
    mutable std::mutex mutex_;
    size_t calls_ = 0;
    std::vector<Completion<T>> pending_;
};

/**
 * Manually advanced clock for TTL tests
 */
class FakeClock {
public:
    FakeClock() : now_(std::make_shared<TimePoint>(Clock::now())) {}

    TimeSource source() const {
        auto now = now_;
        return [now]() { return *now; };
    }

    void advance(Clock::duration d) { *now_ += d; }

private:
    std::shared_ptr<TimePoint> now_;
};

/**
 * In-memory persistent store with failure injection
 */
class MemoryCacher : public Cacher {
public:
    std::optional<std::string> load(const std::string& key, const std::string& domain) override {
        std::lock_guard<std::mutex> lock(mutex_);
        loads++;
        auto it = entries_.find({domain, key});
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void save(const std::string& bytes, const std::string& key, const std::string& domain) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes) {
            throw StorageError("disk full");
        }
        saves++;
        entries_[{domain, key}] = bytes;
    }

    void delete_one(const std::string& key, const std::string& domain) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase({domain, key});
    }

    void delete_domain(const std::string& domain) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.first == domain) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    bool contains(const std::string& key, const std::string& domain) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count({domain, key}) > 0;
    }

    std::atomic<int> loads{0};
    std::atomic<int> saves{0};
    std::atomic<bool> fail_writes{false};

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::string> entries_;
};

/**
 * Unique temporary directory, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("muxcache-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace testing
} // namespace muxcache
