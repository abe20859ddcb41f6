#include "model_cache/stats.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace model_cache;
using model_cache::testing::TempDir;

TEST_CASE("tracker counts sizes, rates and removal causes", "[stats]") {
  auto store = std::make_unique<MemoryStatsStore>();
  auto *raw = store.get();
  StatsTracker t(std::move(store));
  REQUIRE(t.load());

  auto s = t.snapshot();
  CHECK(s.hit_rate == 0.0);
  CHECK(s.miss_rate == 0.0);

  t.on_insert(100);
  t.on_insert(50);
  t.on_replace(50, 70);
  CHECK(t.counters().total_size == 170);
  CHECK(t.counters().entry_count == 2);

  t.record_hit();
  t.record_hit();
  t.record_hit();
  t.record_miss();
  s = t.snapshot();
  CHECK(s.hit_rate == Catch::Approx(0.75));
  CHECK(s.miss_rate == Catch::Approx(0.25));

  t.on_remove(70, RemovalCause::Explicit);
  CHECK(t.counters().eviction_count == 0);
  t.on_remove(100, RemovalCause::Expiration);
  CHECK(t.counters().eviction_count == 1);
  CHECK(t.counters().expiration_count == 1);
  CHECK(t.counters().total_size == 0);
  CHECK(t.counters().entry_count == 0);

  // Write-through: every update above was saved.
  CHECK(raw->saves() == 9);
}

TEST_CASE("reconcile overwrites drifted size and count", "[stats]") {
  StatsTracker t(std::make_unique<MemoryStatsStore>());
  t.on_insert(10);
  CHECK_FALSE(t.reconcile(10, 1));
  CHECK(t.reconcile(42, 3));
  CHECK(t.counters().total_size == 42);
  CHECK(t.counters().entry_count == 3);
}

TEST_CASE("reset zeroes every counter", "[stats]") {
  StatsTracker t(std::make_unique<MemoryStatsStore>());
  t.on_insert(10);
  t.record_hit();
  t.on_remove(10, RemovalCause::Eviction);
  t.reset();
  const auto &c = t.counters();
  CHECK(c.hit_count == 0);
  CHECK(c.eviction_count == 0);
  CHECK(c.total_size == 0);
}

TEST_CASE("file stats store survives a restart", "[stats][persist]") {
  TempDir dir("stats");
  const std::string path = dir.str() + "/nested/cache.stats.json";
  {
    StatsTracker t(std::make_unique<FileStatsStore>(path));
    REQUIRE(t.load());
    t.on_insert(300);
    t.record_hit();
    t.record_miss();
    t.on_remove(300, RemovalCause::Eviction);
    CHECK(t.persist_failures() == 0);
  }
  StatsTracker again(std::make_unique<FileStatsStore>(path));
  REQUIRE(again.load());
  CHECK(again.counters().hit_count == 1);
  CHECK(again.counters().miss_count == 1);
  CHECK(again.counters().eviction_count == 1);
  CHECK(again.counters().entry_count == 0);
}

TEST_CASE("missing stats file loads empty, corrupt one is rejected",
          "[stats][persist]") {
  TempDir dir("stats_corrupt");
  FileStatsStore store(dir.str() + "/absent.json");
  PersistedStats s;
  s.hit_count = 9;
  REQUIRE(store.load(&s));
  CHECK(s.hit_count == 0);

  const std::string bad = dir.str() + "/bad.json";
  std::ofstream(bad) << "not json";
  FileStatsStore corrupt(bad);
  std::string err;
  CHECK_FALSE(corrupt.load(&s, &err));
  CHECK(err.find("corrupt") != std::string::npos);
}

TEST_CASE("stats json keeps camelCase keys", "[stats]") {
  PersistedStats s;
  s.hit_count = 3;
  s.eviction_count = 2;
  const auto json = stats_to_json(s);
  CHECK(json.find("\"hitCount\":3") != std::string::npos);
  CHECK(json.find("\"evictionCount\":2") != std::string::npos);
  PersistedStats back;
  REQUIRE(stats_from_json(json, &back));
  CHECK(back.hit_count == 3);
  CHECK(back.eviction_count == 2);
}
