#include <catch2/catch.hpp>
#include "core/errors.hpp"
#include "mux/multi_requester.hpp"
#include "test_support.hpp"
#include <map>
#include <string>
#include <vector>

using namespace muxcache;
using namespace muxcache::testing;

namespace {

using ProfileMap = MultiplexerMap<std::string, Profile>;
using ProfileRequester = MultiRequester<std::string, Profile>;

struct Fixture {
    int single_calls = 0;
    std::vector<std::vector<std::string>> multi_calls;
    Completion<std::vector<Profile>> pending;
    std::shared_ptr<MemoryCacher> cacher = std::make_shared<MemoryCacher>();
    std::shared_ptr<ProfileMap> map;
    std::unique_ptr<ProfileRequester> requester;

    Fixture() {
        MuxConfig config;
        config.cacher = cacher;
        map = std::make_shared<ProfileMap>("profiles",
            [this](const std::string& key, Completion<Profile> done) {
                single_calls++;
                done(Result<Profile>::success(Profile{key, "single-" + key}));
            },
            config);

        requester = std::make_unique<ProfileRequester>(map,
            [](const Profile& p) { return p.id; },
            [this](const std::vector<std::string>& keys, Completion<std::vector<Profile>> done) {
                multi_calls.push_back(keys);
                pending = std::move(done);
            });
    }
};

} // namespace

TEST_CASE("MultiRequester fetches only what the map lacks", "[multi_requester]") {
    Fixture f;
    f.map->request("u1", [](const Result<Profile>&) {});
    REQUIRE(f.single_calls == 1);

    std::map<std::string, Profile> values;
    std::exception_ptr error;
    f.requester->request({"u1", "u2", "u3"},
        [&values, &error](const std::map<std::string, Profile>& v, std::exception_ptr e) {
            values = v;
            error = e;
        });

    REQUIRE(f.multi_calls.size() == 1);
    REQUIRE(f.multi_calls[0] == std::vector<std::string>{"u2", "u3"});

    f.pending(Result<std::vector<Profile>>::success({Profile{"u2", "multi-u2"}, Profile{"u3", "multi-u3"}}));

    REQUIRE_FALSE(error);
    REQUIRE(values.size() == 3);
    REQUIRE(values["u1"].name == "single-u1");
    REQUIRE(values["u2"].name == "multi-u2");

    SECTION("Results of the multi-key request are cached in the map") {
        std::string name;
        f.map->request("u3", [&name](const Result<Profile>& r) { name = r.value().name; });
        REQUIRE(name == "multi-u3");
        REQUIRE(f.single_calls == 1);
    }

    SECTION("Fully cached request completes without calling the producer") {
        bool called = false;
        f.requester->request({"u1", "u2"}, [&called](const std::map<std::string, Profile>& v, std::exception_ptr e) {
            called = true;
            REQUIRE(v.size() == 2);
            REQUIRE_FALSE(e);
        });
        REQUIRE(called);
        REQUIRE(f.multi_calls.size() == 1);
    }
}

TEST_CASE("MultiRequester failure handling", "[multi_requester]") {
    Fixture f;
    f.map->request("u1", [](const Result<Profile>&) {});
    f.map->refresh("u1");

    std::map<std::string, Profile> values;
    std::exception_ptr error;
    auto record = [&values, &error](const std::map<std::string, Profile>& v, std::exception_ptr e) {
        values = v;
        error = e;
    };

    SECTION("Transient error returns fallback values and the error") {
        f.requester->request({"u1", "u2"}, record);
        REQUIRE(f.multi_calls[0] == std::vector<std::string>{"u1", "u2"});

        f.pending(Result<std::vector<Profile>>::failure(ConnectivityError("offline")));

        REQUIRE(error);
        REQUIRE(is_connectivity_error(error));
        REQUIRE(values.size() == 1);
        REQUIRE(values["u1"].name == "single-u1");
    }

    SECTION("Terminal error returns no stale values") {
        f.requester->request({"u1", "u2"}, record);
        f.pending(Result<std::vector<Profile>>::failure(std::runtime_error("HTTP 500")));

        REQUIRE(error);
        REQUIRE(values.empty());
        REQUIRE(f.map->state("u1") == FetcherState::EMPTY);
    }
}

TEST_CASE("MultiRequester store_success populates the map", "[multi_requester]") {
    Fixture f;
    f.requester->store_success({Profile{"u5", "stored"}});

    REQUIRE(f.map->stored_value("u5")->name == "stored");
    f.map->flush();
    REQUIRE(f.cacher->contains("u5", "profiles"));
}
