#include "model_cache/integrity.hpp"
#include "model_cache/memory_backend.hpp"
#include "model_cache/model_cache.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <fstream>

using namespace model_cache;
using model_cache::testing::bytes;
using model_cache::testing::kind_config;
using model_cache::testing::ManualClock;
using model_cache::testing::memory_config;
using model_cache::testing::TempDir;

namespace {
std::unique_ptr<ModelCache> memory_cache(ManualClock &clock,
                                         std::size_t max_size = 1000,
                                         std::chrono::milliseconds max_age =
                                             std::chrono::hours(24)) {
  return std::make_unique<ModelCache>(memory_config(max_size, max_age),
                                      std::make_unique<MemoryStatsStore>(),
                                      clock.fn());
}

// Holds a backend pointer so a test can corrupt what it stores.
class TamperingBackend final : public IStorageBackend {
public:
  StorageKind kind() const override { return StorageKind::Memory; }
  std::string name() const override { return "tampering"; }
  bool put(const CacheEntry &e, std::string *err) override {
    return inner_.put(e, err);
  }
  std::optional<CacheEntry> get(const std::string &id,
                                std::string *err) override {
    auto e = inner_.get(id, err);
    if (e && corrupt_ && !e->payload.empty())
      e->payload[0] ^= 0xFF;
    return e;
  }
  std::optional<ModelMeta> stat(const std::string &id,
                                std::string *err) override {
    return inner_.stat(id, err);
  }
  bool remove(const std::string &id, std::string *err) override {
    return inner_.remove(id, err);
  }
  bool touch(const std::string &id, TimePoint at, std::string *err) override {
    return inner_.touch(id, at, err);
  }
  bool list_all(std::vector<ModelMeta> *out, std::string *err) override {
    return inner_.list_all(out, err);
  }

  bool *corrupt_flag() { return &corrupt_; }

private:
  MemoryBackend inner_;
  bool corrupt_{false};
};
} // namespace

TEST_CASE("store then retrieve returns identical bytes", "[cache]") {
  const auto kind = GENERATE(StorageKind::Memory, StorageKind::DurableKv,
                             StorageKind::BlobCache);
  TempDir dir("roundtrip");
  ManualClock clock;
  auto cache = std::make_unique<ModelCache>(
      kind_config(kind, dir, 1 << 20), std::make_unique<MemoryStatsStore>(),
      clock.fn());
  REQUIRE(cache->backend_name() == storage_kind_name(kind));
  std::vector<std::uint8_t> payload(4096);
  for (std::size_t i = 0; i < payload.size(); ++i)
    payload[i] = static_cast<std::uint8_t>(i * 31);
  REQUIRE(cache->store("resnet", payload, "1.0"));
  auto got = cache->retrieve("resnet");
  REQUIRE(got);
  CHECK(*got == payload);
}

TEST_CASE("a 1MB artifact is visible through has and stats", "[cache]") {
  ManualClock clock;
  auto cache = std::make_unique<ModelCache>(
      [] {
        auto cfg = memory_config();
        cfg.max_size_bytes = 500ULL * 1024 * 1024;
        return cfg;
      }(),
      std::make_unique<MemoryStatsStore>(), clock.fn());
  REQUIRE(cache->store("m1", bytes(1024 * 1024), "1.0"));
  CHECK(cache->has("m1"));
  CHECK(cache->stats().entry_count == 1);
  CHECK(cache->stats().total_size == 1024 * 1024);
}

TEST_CASE("second store over budget evicts the least recent entry",
          "[cache][eviction]") {
  const auto kind = GENERATE(StorageKind::Memory, StorageKind::DurableKv,
                             StorageKind::BlobCache);
  TempDir dir("evict_one");
  ManualClock clock;
  auto cache = std::make_unique<ModelCache>(
      kind_config(kind, dir, 1000), std::make_unique<MemoryStatsStore>(),
      clock.fn());
  REQUIRE(cache->backend_name() == storage_kind_name(kind));
  REQUIRE(cache->store("A", bytes(600)));
  clock.advance(1);
  REQUIRE(cache->store("B", bytes(600)));
  CHECK_FALSE(cache->has("A"));
  CHECK(cache->has("B"));
  const auto s = cache->stats();
  CHECK(s.total_size == 600);
  CHECK(s.entry_count == 1);
  CHECK(s.eviction_count == 1);
}

TEST_CASE("eviction follows last access, not insertion", "[cache][eviction]") {
  const auto kind = GENERATE(StorageKind::Memory, StorageKind::DurableKv,
                             StorageKind::BlobCache);
  TempDir dir("evict_lru");
  ManualClock clock(0);
  auto cache = std::make_unique<ModelCache>(
      kind_config(kind, dir, 1000), std::make_unique<MemoryStatsStore>(),
      clock.fn());
  REQUIRE(cache->backend_name() == storage_kind_name(kind));
  clock.set(1);
  REQUIRE(cache->store("A", bytes(300)));
  clock.set(2);
  REQUIRE(cache->store("B", bytes(300)));
  clock.set(3);
  REQUIRE(cache->store("C", bytes(300)));

  SECTION("oldest access goes first") {
    clock.set(4);
    REQUIRE(cache->store("D", bytes(300)));
    CHECK_FALSE(cache->has("A"));
    CHECK(cache->has("B"));
    CHECK(cache->has("C"));
    CHECK(cache->has("D"));
  }

  SECTION("a retrieve refreshes recency") {
    clock.set(4);
    REQUIRE(cache->retrieve("A"));
    clock.set(5);
    REQUIRE(cache->store("D", bytes(300)));
    CHECK(cache->has("A"));
    CHECK_FALSE(cache->has("B"));
  }

  SECTION("only as much as needed is evicted") {
    clock.set(4);
    REQUIRE(cache->store("D", bytes(50)));
    CHECK(cache->stats().eviction_count == 0);
    REQUIRE(cache->store("E", bytes(100)));
    CHECK(cache->stats().eviction_count == 1);
    CHECK(cache->stats().total_size == 750);
  }
}

TEST_CASE("payload larger than max size is rejected", "[cache][capacity]") {
  ManualClock clock;
  auto cache = memory_cache(clock, 1000);
  CacheError err;
  CHECK_FALSE(cache->store("huge", bytes(2000), "1.0.0", &err));
  CHECK(err.code == ErrorCode::Capacity);
  CHECK(err.message.find("2000") != std::string::npos);
  CHECK(cache->stats().entry_count == 0);
  CHECK(cache->stats().total_size == 0);
}

TEST_CASE("empty ids are invalid", "[cache]") {
  ManualClock clock;
  auto cache = memory_cache(clock);
  CacheError err;
  CHECK_FALSE(cache->store("", bytes(1), "1.0.0", &err));
  CHECK(err.code == ErrorCode::InvalidArgument);
}

TEST_CASE("hit rate counts hits over all lookups", "[cache][stats]") {
  ManualClock clock;
  auto cache = memory_cache(clock);
  REQUIRE(cache->store("x", bytes(10)));
  REQUIRE(cache->retrieve("x"));
  REQUIRE(cache->retrieve("x"));
  REQUIRE(cache->retrieve("x"));
  CHECK_FALSE(cache->retrieve("missing"));
  const auto s = cache->stats();
  CHECK(s.hit_rate == Catch::Approx(0.75));
  CHECK(s.miss_rate == Catch::Approx(0.25));
}

TEST_CASE("entries expire strictly after max age", "[cache][expiry]") {
  const auto kind = GENERATE(StorageKind::Memory, StorageKind::DurableKv,
                             StorageKind::BlobCache);
  TempDir dir("expiry");
  ManualClock clock(0);
  auto cache = std::make_unique<ModelCache>(
      kind_config(kind, dir, 1000, std::chrono::milliseconds(100)),
      std::make_unique<MemoryStatsStore>(), clock.fn());
  REQUIRE(cache->backend_name() == storage_kind_name(kind));
  REQUIRE(cache->store("e", bytes(10)));
  clock.set(99);
  CHECK(cache->retrieve("e"));
  clock.set(100);
  CHECK(cache->has("e"));
  clock.set(101);
  CHECK_FALSE(cache->retrieve("e"));
  const auto s = cache->stats();
  CHECK(s.entry_count == 0);
  CHECK(s.total_size == 0);
  CHECK(s.eviction_count == 1);
  CHECK(s.expiration_count == 1);
  CHECK(s.miss_count == 1);
}

TEST_CASE("expiry ignores sub-millisecond clock offsets on every backend",
          "[cache][expiry]") {
  const auto kind = GENERATE(StorageKind::Memory, StorageKind::DurableKv,
                             StorageKind::BlobCache);
  TempDir dir("expiry_us");
  ManualClock clock;
  auto cache = std::make_unique<ModelCache>(
      kind_config(kind, dir, 1000, std::chrono::milliseconds(100)),
      std::make_unique<MemoryStatsStore>(), clock.fn());
  REQUIRE(cache->backend_name() == storage_kind_name(kind));

  clock.set_us(1'000'000'900);
  REQUIRE(cache->store("m", bytes(10)));
  const auto stored = cache->list();
  REQUIRE(stored.size() == 1);
  CHECK(stored[0].created_at == from_epoch_ms(1'000'000));

  // 99.5 ms of real age.
  clock.set_us(1'000'100'400);
  CHECK(cache->has("m"));
  clock.set_us(1'000'100'999);
  CHECK(cache->has("m"));
  clock.set_us(1'000'101'000);
  CHECK_FALSE(cache->has("m"));
  CHECK(cache->stats().expiration_count == 1);
}

TEST_CASE("remove is idempotent", "[cache]") {
  ManualClock clock;
  auto cache = memory_cache(clock);
  REQUIRE(cache->store("r", bytes(40)));
  CHECK(cache->remove("r"));
  CHECK(cache->remove("r"));
  CHECK(cache->stats().entry_count == 0);
  CHECK(cache->stats().total_size == 0);
  CHECK(cache->stats().eviction_count == 0);
}

TEST_CASE("re-storing an id replaces it without double counting",
          "[cache]") {
  ManualClock clock;
  auto cache = memory_cache(clock);
  REQUIRE(cache->store("v", bytes(100, 1), "1.0"));
  REQUIRE(cache->store("v", bytes(250, 2), "2.0"));
  const auto s = cache->stats();
  CHECK(s.entry_count == 1);
  CHECK(s.total_size == 250);
  auto listed = cache->list();
  REQUIRE(listed.size() == 1);
  CHECK(listed[0].version == "2.0");
  CHECK(listed[0].checksum == sha256_hex(bytes(250, 2)));
}

TEST_CASE("replacing an entry counts its own bytes as free",
          "[cache][eviction]") {
  ManualClock clock;
  auto cache = memory_cache(clock, 1000);
  REQUIRE(cache->store("a", bytes(400)));
  REQUIRE(cache->store("b", bytes(400)));
  REQUIRE(cache->store("b", bytes(600)));
  CHECK(cache->stats().eviction_count == 0);
  CHECK(cache->stats().total_size == 1000);
}

TEST_CASE("clear empties the cache and resets stats", "[cache]") {
  ManualClock clock;
  auto cache = memory_cache(clock);
  REQUIRE(cache->store("a", bytes(10)));
  REQUIRE(cache->store("b", bytes(20)));
  REQUIRE(cache->retrieve("a"));
  REQUIRE(cache->clear());
  const auto s = cache->stats();
  CHECK(s.entry_count == 0);
  CHECK(s.total_size == 0);
  CHECK(s.hit_count == 0);
  CHECK(s.hit_rate == 0.0);
  CHECK(cache->list().empty());
  CHECK_FALSE(cache->has("b"));
}

TEST_CASE("corrupt payloads are never served", "[cache][integrity]") {
  ManualClock clock;
  auto backend = std::make_unique<TamperingBackend>();
  bool *corrupt = backend->corrupt_flag();
  auto cfg = memory_config();
  ModelCache cache(cfg, std::move(backend),
                   std::make_unique<MemoryStatsStore>(), clock.fn());
  REQUIRE(cache.store("c", bytes(64)));
  REQUIRE(cache.verify("c"));
  *corrupt = true;

  SECTION("explicit verify drops the entry") {
    CacheError err;
    CHECK_FALSE(cache.verify("c", &err));
    CHECK(err.code == ErrorCode::Integrity);
    const auto s = cache.stats();
    CHECK(s.entry_count == 0);
    CHECK(s.miss_count == 1);
    CHECK(s.hit_count == 0);
  }

  SECTION("verify on retrieve turns corruption into a miss") {
    ConfigUpdate u;
    u.verify_on_retrieve = true;
    cache.update_config(u);
    CacheError err;
    CHECK_FALSE(cache.retrieve("c", &err));
    CHECK(err.code == ErrorCode::Integrity);
    const auto s = cache.stats();
    CHECK(s.entry_count == 0);
    CHECK(s.miss_count == 1);
    CHECK(s.eviction_count == 0);
  }
}

TEST_CASE("update_config affects later operations only", "[cache][config]") {
  ManualClock clock;
  auto cache = memory_cache(clock, 1000);
  REQUIRE(cache->store("a", bytes(400)));
  REQUIRE(cache->store("b", bytes(400)));
  ConfigUpdate u;
  u.max_size_bytes = 500;
  u.compression_enabled = false;
  cache->update_config(u);
  const auto cfg = cache->config();
  CHECK(cfg.max_size_bytes == 500);
  CHECK_FALSE(cfg.compression_enabled);
  CHECK(cfg.storage == StorageKind::Memory);
  // Nothing is evicted until the next store.
  CHECK(cache->stats().entry_count == 2);
  clock.advance(1);
  REQUIRE(cache->store("c", bytes(100)));
  CHECK(cache->stats().total_size <= 500);
  CHECK(cache->has("c"));
}

TEST_CASE("switching storage orphans the old entries", "[cache][config]") {
  TempDir dir("switch");
  ManualClock clock;
  auto cfg = memory_config();
  cfg.data_dir = dir.str();
  ModelCache cache(cfg, std::make_unique<MemoryStatsStore>(), clock.fn());
  REQUIRE(cache.store("old", bytes(10)));
  ConfigUpdate u;
  u.storage = StorageKind::DurableKv;
  cache.update_config(u);
  CHECK(cache.backend_name() == "durable-kv");
  CHECK(cache.config().storage == StorageKind::DurableKv);
  CHECK_FALSE(cache.has("old"));
  CHECK(cache.stats().entry_count == 0);
}

TEST_CASE("unavailable storage falls back to memory for good",
          "[cache][fallback]") {
  const auto kind = GENERATE(StorageKind::DurableKv, StorageKind::BlobCache);
  TempDir dir("fallback");
  const std::string blocker = dir.str() + "/not_a_dir";
  std::ofstream(blocker) << "x";

  ManualClock clock;
  CacheConfig cfg;
  cfg.storage = kind;
  cfg.data_dir = blocker + "/data";
  ModelCache cache(cfg, std::make_unique<MemoryStatsStore>(), clock.fn());
  CHECK(cache.fell_back());
  CHECK(cache.backend_state() == BackendState::Fallback);
  CHECK(cache.backend_name() == "memory");
  CHECK(cache.config().storage == StorageKind::Memory);
  REQUIRE(cache.store("m", bytes(8)));
  CHECK(cache.retrieve("m"));

  ConfigUpdate u;
  u.storage = StorageKind::DurableKv;
  cache.update_config(u);
  CHECK(cache.backend_name() == "memory");
  CHECK(cache.has("m"));
  CHECK(cache.info().find("backend_state:fallback") != std::string::npos);
}

TEST_CASE("durable cache resumes entries and stats after restart",
          "[cache][persist]") {
  const auto kind = GENERATE(StorageKind::DurableKv, StorageKind::BlobCache);
  TempDir dir("restart");
  CacheConfig cfg;
  cfg.storage = kind;
  cfg.data_dir = dir.str();
  cfg.max_size_bytes = 10000;
  {
    ModelCache cache(cfg);
    CHECK_FALSE(cache.fell_back());
    REQUIRE(cache.store("a", bytes(100)));
    REQUIRE(cache.store("b", bytes(200)));
    REQUIRE(cache.retrieve("a"));
    CHECK_FALSE(cache.retrieve("zzz"));
  }
  ModelCache cache(cfg);
  const auto s = cache.stats();
  CHECK(s.entry_count == 2);
  CHECK(s.total_size == 300);
  CHECK(s.hit_count == 1);
  CHECK(s.miss_count == 1);
  auto got = cache.retrieve("b");
  REQUIRE(got);
  CHECK(got->size() == 200);
}

TEST_CASE("stale persisted totals are repaired on startup",
          "[cache][persist]") {
  TempDir dir("repair");
  CacheConfig cfg;
  cfg.storage = StorageKind::DurableKv;
  cfg.data_dir = dir.str();
  {
    ModelCache cache(cfg);
    REQUIRE(cache.store("a", bytes(100)));
  }
  PersistedStats lie;
  lie.total_size = 999999;
  lie.entry_count = 42;
  lie.hit_count = 5;
  FileStatsStore(dir.str() + "/" + cfg.cache_name + ".stats.json").save(lie);

  ModelCache cache(cfg);
  const auto s = cache.stats();
  CHECK(s.total_size == 100);
  CHECK(s.entry_count == 1);
  CHECK(s.hit_count == 5);
}

TEST_CASE("list skips expired entries and orders by recency", "[cache]") {
  ManualClock clock(0);
  auto cache = memory_cache(clock, 1000, std::chrono::milliseconds(100));
  REQUIRE(cache->store("old", bytes(1)));
  clock.set(50);
  REQUIRE(cache->store("newer", bytes(1)));
  clock.set(60);
  REQUIRE(cache->store("newest", bytes(1)));
  clock.set(70);
  REQUIRE(cache->retrieve("newer"));
  clock.set(120);
  auto listed = cache->list();
  REQUIRE(listed.size() == 2);
  CHECK(listed[0].id == "newest");
  CHECK(listed[1].id == "newer");
}

TEST_CASE("info reports backend and counters", "[cache]") {
  ManualClock clock;
  auto cache = memory_cache(clock);
  REQUIRE(cache->store("i", bytes(3)));
  const auto info = cache->info();
  CHECK(info.find("backend:memory") != std::string::npos);
  CHECK(info.find("backend_state:preferred") != std::string::npos);
  CHECK(info.find("total_size:3") != std::string::npos);
  CHECK(info.find("entry_count:1") != std::string::npos);
  CHECK(std::string(error_code_name(ErrorCode::Capacity)) == "capacity");
}
