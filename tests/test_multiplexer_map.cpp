#include <catch2/catch.hpp>
#include "core/errors.hpp"
#include "mux/multiplexer_map.hpp"
#include "storage/json_disk_cacher.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace muxcache;
using namespace muxcache::testing;

namespace {

// Records producer calls per key; completions are resolved by the test
class KeyedProducer {
public:
    void operator()(const std::string& key, Completion<Profile> done) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_[key]++;
        pending_[key].push_back(std::move(done));
    }

    int calls(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[key];
    }

    void resolve(const std::string& key, const Result<Profile>& result) {
        Completion<Profile> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& queue = pending_[key];
            done = std::move(queue.front());
            queue.erase(queue.begin());
        }
        done(result);
    }

    void succeed(const std::string& key, const std::string& name) {
        resolve(key, Result<Profile>::success(Profile{key, name}));
    }

private:
    std::mutex mutex_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::vector<Completion<Profile>>> pending_;
};

using ProfileMap = MultiplexerMap<std::string, Profile>;

} // namespace

TEST_CASE("MultiplexerMap shares one fetch per key", "[multiplexer_map]") {
    KeyedProducer producer;
    auto cacher = std::make_shared<MemoryCacher>();
    MuxConfig config;
    config.cacher = cacher;

    auto profiles = std::make_shared<ProfileMap>("profiles",
        [&producer](const std::string& key, Completion<Profile> done) { producer(key, std::move(done)); },
        config);

    std::vector<std::string> received;
    auto record = [&received](const Result<Profile>& r) { received.push_back(r.value().id + "/" + r.value().name); };

    profiles->request("u1", record);
    profiles->request("u2", record);
    profiles->request("u1", record);

    REQUIRE(producer.calls("u1") == 1);
    REQUIRE(producer.calls("u2") == 1);
    REQUIRE(profiles->size() == 2);

    SECTION("Keys complete independently") {
        producer.succeed("u2", "Bob");
        REQUIRE(received == std::vector<std::string>{"u2/Bob"});
        REQUIRE(profiles->state("u1") == FetcherState::FETCHING);
        REQUIRE(profiles->state("u2") == FetcherState::FRESH);

        producer.succeed("u1", "Alice");
        REQUIRE(received == std::vector<std::string>{"u2/Bob", "u1/Alice", "u1/Alice"});
    }

    SECTION("Fresh keys are served from memory") {
        producer.succeed("u1", "Alice");
        profiles->request("u1", record);
        REQUIRE(producer.calls("u1") == 1);
        REQUIRE(profiles->stored_value("u1")->name == "Alice");
    }

    SECTION("refresh(key) affects only that key") {
        producer.succeed("u1", "Alice");
        producer.succeed("u2", "Bob");

        profiles->refresh("u1");
        profiles->request("u1", record);
        profiles->request("u2", record);

        REQUIRE(producer.calls("u1") == 2);
        REQUIRE(producer.calls("u2") == 1);
    }

    SECTION("refresh(key) during a fetch joins it") {
        profiles->refresh("u1");
        profiles->request("u1", record);
        REQUIRE(producer.calls("u1") == 1);

        producer.succeed("u1", "Alice");
        REQUIRE(received == std::vector<std::string>{"u1/Alice", "u1/Alice", "u1/Alice"});

        profiles->request("u1", record);
        REQUIRE(producer.calls("u1") == 1);
    }

    SECTION("refresh() of an unknown key does not create it") {
        profiles->refresh("u9");
        REQUIRE(profiles->size() == 2);
        REQUIRE(profiles->state("u9") == FetcherState::EMPTY);
    }
}

TEST_CASE("MultiplexerMap two back-to-back requests with a slow producer", "[multiplexer_map][threads]") {
    std::atomic<int> producer_calls{0};
    std::vector<std::thread> workers;

    MuxConfig config;
    config.ttl = std::chrono::seconds(1);
    config.cacher = std::make_shared<NoCacher>();

    auto profiles = std::make_shared<ProfileMap>("profiles",
        [&producer_calls, &workers](const std::string& key, Completion<Profile> done) {
            producer_calls++;
            workers.emplace_back([key, done]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                done(Result<Profile>::success(Profile{key, "Obj"}));
            });
        },
        config);

    std::mutex mutex;
    std::vector<Profile> results;
    auto record = [&mutex, &results](const Result<Profile>& r) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(r.value());
    };

    profiles->request("u1", record);
    profiles->request("u1", record);

    for (auto& t : workers) {
        t.join();
    }

    REQUIRE(producer_calls == 1);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0] == Profile{"u1", "Obj"});
    REQUIRE(results[0] == results[1]);
}

TEST_CASE("MultiplexerMap invalidation", "[multiplexer_map]") {
    KeyedProducer producer;
    auto cacher = std::make_shared<MemoryCacher>();
    MuxConfig config;
    config.cacher = cacher;

    auto profiles = std::make_shared<ProfileMap>("profiles",
        [&producer](const std::string& key, Completion<Profile> done) { producer(key, std::move(done)); },
        config);

    profiles->request("u1", [](const Result<Profile>&) {});
    profiles->request("u2", [](const Result<Profile>&) {});
    producer.succeed("u1", "Alice");
    producer.succeed("u2", "Bob");
    profiles->flush();
    REQUIRE(cacher->contains("u1", "profiles"));
    REQUIRE(cacher->contains("u2", "profiles"));

    SECTION("clear_memory(key) forgets one key in memory only") {
        profiles->clear_memory("u1");
        REQUIRE(profiles->size() == 1);
        REQUIRE(profiles->state("u1") == FetcherState::EMPTY);
        REQUIRE(cacher->contains("u1", "profiles"));
    }

    SECTION("clear(key) also removes the persisted copy") {
        profiles->clear("u1");
        REQUIRE_FALSE(cacher->contains("u1", "profiles"));
        REQUIRE(cacher->contains("u2", "profiles"));
    }

    SECTION("clear() removes every key everywhere") {
        profiles->clear();
        REQUIRE(profiles->size() == 0);
        REQUIRE_FALSE(cacher->contains("u1", "profiles"));
        REQUIRE_FALSE(cacher->contains("u2", "profiles"));
    }

    SECTION("clear_memory(key) during a fetch still answers the waiters") {
        profiles->refresh("u1");
        std::string name;
        profiles->request("u1", [&name](const Result<Profile>& r) { name = r.value().name; });
        profiles->clear_memory("u1");
        producer.succeed("u1", "Alice2");

        REQUIRE(name == "Alice2");
        REQUIRE(profiles->state("u1") == FetcherState::EMPTY);
    }
}

TEST_CASE("MultiplexerMap persistence round-trip", "[multiplexer_map]") {
    TempDir dir;
    KeyedProducer producer;
    MuxConfig config;
    config.cacher = std::make_shared<JsonDiskCacher>(dir.path());

    auto profiles = std::make_shared<ProfileMap>("profiles",
        [&producer](const std::string& key, Completion<Profile> done) { producer(key, std::move(done)); },
        config);

    profiles->request("u1", [](const Result<Profile>&) {});
    producer.succeed("u1", "Alice");
    profiles->flush();

    REQUIRE(std::filesystem::exists(dir.path() / "profiles" / "u1.json"));

    // Same cache ID in a new process, now offline
    KeyedProducer offline;
    auto restarted = std::make_shared<ProfileMap>("profiles",
        [&offline](const std::string& key, Completion<Profile> done) { offline(key, std::move(done)); },
        config);

    Result<Profile> received = Result<Profile>::failure(std::runtime_error("not called"));
    restarted->request("u1", [&received](const Result<Profile>& r) { received = r; });
    offline.resolve("u1", Result<Profile>::failure(ConnectivityError("offline")));

    REQUIRE(received.ok());
    REQUIRE(received.value() == Profile{"u1", "Alice"});

    SECTION("Unknown keys still fail") {
        bool failed = false;
        restarted->request("u2", [&failed](const Result<Profile>& r) { failed = !r.ok(); });
        offline.resolve("u2", Result<Profile>::failure(ConnectivityError("offline")));
        REQUIRE(failed);
    }
}

TEST_CASE("MultiplexerMap integer keys", "[multiplexer_map]") {
    ManualProducer<std::string> producer;
    MuxConfig config;
    config.cacher = std::make_shared<MemoryCacher>();

    auto cities = std::make_shared<MultiplexerMap<int, std::string>>("cities",
        [&producer](const int&, Completion<std::string> done) { producer(std::move(done)); },
        config);

    std::string name;
    cities->request(42, [&name](const Result<std::string>& r) { name = r.value(); });
    producer.succeed("Yerevan");

    REQUIRE(name == "Yerevan");
    REQUIRE(cities->stored_value(42) == std::string("Yerevan"));
}

TEST_CASE("MultiplexerMap rejects invalid arguments", "[multiplexer_map]") {
    auto producer = [](const std::string&, Completion<Profile>) {};
    auto profiles = std::make_shared<ProfileMap>("profiles", producer);

    REQUIRE_THROWS_AS(profiles->request("", [](const Result<Profile>&) {}), std::invalid_argument);
    REQUIRE_THROWS_AS(profiles->clear(""), std::invalid_argument);
    REQUIRE_THROWS_AS(ProfileMap("", producer), std::invalid_argument);
    REQUIRE_THROWS_AS(ProfileMap("profiles", nullptr), std::invalid_argument);
}
