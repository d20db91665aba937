/**
 * Example: caching a weather backend with muxcache
 *
 * Demonstrates a MultiplexerMap in front of a slow, occasionally offline
 * backend, a Multiplexer for a single document, a Zipper joining both, and
 * MuxRepository bulk operations.
 *
 * Build (from the repository root):
 *   cmake -S . -B build && cmake --build build --target mux_usage
 *
 * Run:
 *   ./build/mux_usage [settings.json]
 */

#include "config/settings.hpp"
#include "core/errors.hpp"
#include "mux/multiplexer.hpp"
#include "mux/multiplexer_map.hpp"
#include "mux/repository.hpp"
#include "mux/zipper.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace muxcache;

// Weather report for one location
struct LocationInfo {
    std::string id;
    std::string city;
    double temperature;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LocationInfo, id, city, temperature)

// Simulated remote backend: answers on a worker thread after a delay
class Backend {
public:
    ~Backend() {
        for (auto& worker : workers_) {
            worker.join();
        }
    }

    void set_online(bool online) { online_ = online; }

    int calls() const { return calls_; }

    void fetch_weather(const std::string& location_id, Completion<LocationInfo> done) {
        calls_++;
        bool online = online_;
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.emplace_back([location_id, done, online]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (!online) {
                done(Result<LocationInfo>::failure(ConnectivityError("The Internet connection appears to be offline")));
                return;
            }
            done(Result<LocationInfo>::success(
                LocationInfo{location_id, "City " + location_id, 20.0 + static_cast<double>(location_id.size())}));
        });
    }

private:
    std::atomic<bool> online_{true};
    std::atomic<int> calls_{0};
    std::mutex mutex_;
    std::vector<std::thread> workers_;
};

// Blocks until a number of callbacks have run
class Latch {
public:
    explicit Latch(int count) : count_(count) {}

    void count_down() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--count_ == 0) {
            cv_.notify_all();
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return count_ <= 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int count_;
};

int main(int argc, char* argv[]) {
    MuxSettings settings;
    try {
        if (argc > 1) {
            settings = parse_settings_from_file(argv[1]);
        }
    } catch (const SettingsParseError& e) {
        std::cerr << "✗ Invalid settings: " << e.what() << "\n";
        return 1;
    }

    settings.log_level = LogLevel::INFO;
    settings.apply_logging();

    Backend backend;

    auto weather = std::make_shared<MultiplexerMap<std::string, LocationInfo>>("weather",
        [&backend](const std::string& id, Completion<LocationInfo> done) {
            backend.fetch_weather(id, std::move(done));
        },
        settings.mux_config());

    auto home = std::make_shared<Multiplexer<LocationInfo>>("home-location",
        [&backend](Completion<LocationInfo> done) { backend.fetch_weather("home", std::move(done)); },
        settings.mux_config());

    MuxRepository::main().register_member(weather);
    MuxRepository::main().register_member(home);

    // 1. Concurrent requests for the same key share one backend call
    {
        Latch latch(3);
        for (int i = 0; i < 3; ++i) {
            weather->request("yerevan", [&latch, i](const Result<LocationInfo>& r) {
                std::cout << "caller " << i << ": " << r.value().city << " " << r.value().temperature << "\n";
                latch.count_down();
            });
        }
        latch.wait();
        std::cout << "✓ backend calls so far: " << backend.calls() << "\n";
    }

    // 2. Join heterogeneous requests
    {
        Latch latch(1);
        Zipper()
            .add(home)
            .add("yerevan", weather)
            .add("paris", weather)
            .sync([&latch](const std::vector<Zipper::AnyResult>& results) {
                for (const auto& result : results) {
                    if (result.ok()) {
                        std::cout << "zipped: " << std::any_cast<LocationInfo>(result.value()).city << "\n";
                    } else {
                        std::cout << "zipped error: " << result.error_message() << "\n";
                    }
                }
                latch.count_down();
            });
        latch.wait();
    }

    // 3. Persist, go offline, and fall back to the cached value
    MuxRepository::main().flush_all();
    backend.set_online(false);
    weather->refresh("paris");
    {
        Latch latch(1);
        weather->request("paris", [&latch](const Result<LocationInfo>& r) {
            if (r.ok()) {
                std::cout << "✓ offline, served cached " << r.value().city << "\n";
            } else {
                std::cout << "✗ offline: " << r.error_message() << "\n";
            }
            latch.count_down();
        });
        latch.wait();
    }

    // 4. Sign-out: wipe everything
    MuxRepository::main().clear_all();
    MuxRepository::main().reset();
    std::cout << "✓ total backend calls: " << backend.calls() << "\n";
    return 0;
}
