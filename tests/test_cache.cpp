#include <catch2/catch.hpp>
#include <stencil/cache.hpp>
#include "test_support.hpp"

#include <atomic>
#include <limits>
#include <memory>
#include <thread>

using namespace stencil;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace {

// Manually advanced clock shared with the store
struct FakeClock {
    std::shared_ptr<system_clock::time_point> now =
        std::make_shared<system_clock::time_point>(system_clock::time_point(seconds(1700000000)));

    CacheStore::Clock fn() const {
        auto p = now;
        return [p] { return *p; };
    }
    void advance(seconds s) { *now += s; }
};

CacheEntry make_entry(const std::string& name, const std::string& path,
                      system_clock::time_point at) {
    CacheEntry e;
    e.metadata.name = name;
    e.metadata.version = "1.0.0";
    e.metadata.project_type = "vue";
    e.resolved_path = path;
    e.cached_at = at;
    return e;
}

} // namespace

TEST_CASE("make_key joins type and name", "[cache]") {
    REQUIRE(CacheStore::make_key("vue", "starter") == "vue:starter");
}

TEST_CASE("get on an empty store is a miss", "[cache]") {
    CacheStore cache(seconds(60));
    REQUIRE(cache.ttl() == seconds(60));
    REQUIRE_FALSE(cache.get("vue:starter").has_value());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("put then get within TTL", "[cache]") {
    FakeClock clock;
    CacheStore cache(seconds(60), clock.fn());
    REQUIRE(cache.put("vue:starter", make_entry("starter", "/t/starter", cache.now())).is_ok());

    clock.advance(seconds(60));
    auto hit = cache.get("vue:starter");
    REQUIRE(hit.has_value());
    REQUIRE(hit->resolved_path == "/t/starter");
    REQUIRE(hit->metadata.name == "starter");
}

TEST_CASE("Entries expire once elapsed time exceeds TTL", "[cache]") {
    FakeClock clock;
    CacheStore cache(seconds(60), clock.fn());
    REQUIRE(cache.put("vue:starter", make_entry("starter", "/t", cache.now())).is_ok());

    clock.advance(seconds(61));
    REQUIRE_FALSE(cache.get("vue:starter").has_value());
}

TEST_CASE("A clock reading before cached_at counts as expired", "[cache]") {
    FakeClock clock;
    CacheStore cache(seconds(3600), clock.fn());
    auto entry = make_entry("starter", "/t", cache.now() + seconds(10));
    REQUIRE(cache.is_expired(entry));
    REQUIRE_FALSE(cache.is_expired(make_entry("starter", "/t", cache.now())));
}

TEST_CASE("A TTL beyond the clock's range keeps entries fresh", "[cache]") {
    FakeClock clock;
    CacheStore cache(seconds(10000000000LL), clock.fn());
    REQUIRE(cache.put("vue:starter", make_entry("starter", "/t", cache.now())).is_ok());

    clock.advance(seconds(1));
    REQUIRE_FALSE(cache.is_expired(make_entry("starter", "/t", cache.now() - seconds(1))));
    REQUIRE(cache.get("vue:starter").has_value());

    CacheStore forever(seconds(std::numeric_limits<int64_t>::max()), clock.fn());
    REQUIRE_FALSE(forever.is_expired(make_entry("starter", "/t", cache.now() - seconds(86400))));
}

TEST_CASE("Expiry keeps sub-second precision at the TTL boundary", "[cache]") {
    FakeClock clock;
    CacheStore cache(seconds(60), clock.fn());
    auto entry = make_entry("starter", "/t", cache.now());
    clock.advance(seconds(60));
    REQUIRE_FALSE(cache.is_expired(entry));
    *clock.now += std::chrono::milliseconds(1);
    REQUIRE(cache.is_expired(entry));
}

TEST_CASE("put overwrites unconditionally", "[cache]") {
    CacheStore cache(seconds(60));
    REQUIRE(cache.put("k", make_entry("a", "/first", cache.now())).is_ok());
    REQUIRE(cache.put("k", make_entry("a", "/second", cache.now())).is_ok());
    REQUIRE(cache.get("k")->resolved_path == "/second");
    REQUIRE(cache.size() == 1);
}

TEST_CASE("remove and clear", "[cache]") {
    CacheStore cache(seconds(60));
    REQUIRE(cache.put("a", make_entry("a", "/a", cache.now())).is_ok());
    REQUIRE(cache.put("b", make_entry("b", "/b", cache.now())).is_ok());

    REQUIRE(cache.remove("a").is_ok());
    REQUIRE_FALSE(cache.get("a").has_value());
    REQUIRE(cache.get("b").has_value());

    REQUIRE(cache.clear().is_ok());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("prune drops only expired entries", "[cache]") {
    FakeClock clock;
    CacheStore cache(seconds(60), clock.fn());
    REQUIRE(cache.put("old", make_entry("old", "/old", cache.now())).is_ok());
    clock.advance(seconds(50));
    REQUIRE(cache.put("new", make_entry("new", "/new", cache.now())).is_ok());
    clock.advance(seconds(20));

    auto pruned = cache.prune();
    REQUIRE(pruned.is_ok());
    REQUIRE(pruned.value() == 1);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("new").has_value());
}

TEST_CASE("Concurrent readers and writers", "[cache]") {
    CacheStore cache(seconds(60));
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &mismatches, t] {
            for (int i = 0; i < 200; ++i) {
                std::string key = "k" + std::to_string(i % 10);
                if (cache.put(key, make_entry(key, "/p" + std::to_string(t), cache.now())).is_err()) {
                    ++mismatches;
                }
                auto hit = cache.get(key);
                if (!hit || hit->metadata.name != key) ++mismatches;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(mismatches == 0);
    REQUIRE(cache.size() == 10);
}

// ---------------------------------------------------------------------------
// Persistent index
// ---------------------------------------------------------------------------

TEST_CASE("Index survives a new store", "[cache][index]") {
    TempDir tmp;
    std::string db = (tmp / "index.db").string();
    FakeClock clock;

    {
        CacheStore cache(seconds(60), clock.fn());
        REQUIRE(cache.open_index(db).is_ok());
        REQUIRE(cache.has_index());
        auto entry = make_entry("starter", "/t/starter", cache.now());
        TemplateVariable var;
        var.name = "project_name";
        var.required = true;
        entry.metadata.variables.push_back(var);
        REQUIRE(cache.put("vue:starter", entry).is_ok());
    }
    REQUIRE(fs::exists(db));

    CacheStore reopened(seconds(60), clock.fn());
    REQUIRE(reopened.open_index(db).is_ok());
    REQUIRE(reopened.size() == 0);

    auto hit = reopened.get("vue:starter");
    REQUIRE(hit.has_value());
    REQUIRE(hit->resolved_path == "/t/starter");
    REQUIRE(hit->metadata.variables.size() == 1);
    REQUIRE(hit->metadata.variables[0].required);
    REQUIRE(reopened.size() == 1);
}

TEST_CASE("Expired index rows are not promoted", "[cache][index]") {
    TempDir tmp;
    std::string db = (tmp / "index.db").string();
    FakeClock clock;
    {
        CacheStore cache(seconds(60), clock.fn());
        REQUIRE(cache.open_index(db).is_ok());
        REQUIRE(cache.put("vue:starter", make_entry("starter", "/t", cache.now())).is_ok());
    }
    clock.advance(seconds(120));

    CacheStore reopened(seconds(60), clock.fn());
    REQUIRE(reopened.open_index(db).is_ok());
    REQUIRE_FALSE(reopened.get("vue:starter").has_value());

    auto pruned = reopened.prune();
    REQUIRE(pruned.is_ok());
    REQUIRE(pruned.value() == 1);
}

TEST_CASE("prune with a huge TTL keeps index rows", "[cache][index]") {
    TempDir tmp;
    FakeClock clock;
    CacheStore cache(seconds(std::numeric_limits<int64_t>::max()), clock.fn());
    REQUIRE(cache.open_index((tmp / "index.db").string()).is_ok());
    REQUIRE(cache.put("vue:starter", make_entry("starter", "/t", cache.now())).is_ok());
    clock.advance(seconds(86400));

    auto pruned = cache.prune();
    REQUIRE(pruned.is_ok());
    REQUIRE(pruned.value() == 0);
    REQUIRE(cache.get("vue:starter").has_value());
}

TEST_CASE("remove and clear reach the index", "[cache][index]") {
    TempDir tmp;
    std::string db = (tmp / "index.db").string();
    {
        CacheStore cache(seconds(60));
        REQUIRE(cache.open_index(db).is_ok());
        REQUIRE(cache.put("a", make_entry("a", "/a", cache.now())).is_ok());
        REQUIRE(cache.put("b", make_entry("b", "/b", cache.now())).is_ok());
        REQUIRE(cache.remove("a").is_ok());
    }
    {
        CacheStore cache(seconds(60));
        REQUIRE(cache.open_index(db).is_ok());
        REQUIRE_FALSE(cache.get("a").has_value());
        REQUIRE(cache.get("b").has_value());
        REQUIRE(cache.clear().is_ok());
    }
    CacheStore cache(seconds(60));
    REQUIRE(cache.open_index(db).is_ok());
    REQUIRE_FALSE(cache.get("b").has_value());
}

TEST_CASE("A corrupt index file is recreated", "[cache][index]") {
    TempDir tmp;
    std::string db = (tmp / "index.db").string();
    write_file(db, std::string(4096, 'Z'));

    CacheStore cache(seconds(60));
    REQUIRE(cache.open_index(db).is_ok());
    REQUIRE(cache.put("k", make_entry("k", "/k", cache.now())).is_ok());
    REQUIRE(cache.get("k").has_value());
}

TEST_CASE("close_index falls back to memory only", "[cache][index]") {
    TempDir tmp;
    CacheStore cache(seconds(60));
    REQUIRE(cache.open_index((tmp / "index.db").string()).is_ok());
    cache.close_index();
    REQUIRE_FALSE(cache.has_index());
    REQUIRE(cache.put("k", make_entry("k", "/k", cache.now())).is_ok());
    REQUIRE(cache.get("k").has_value());
}
