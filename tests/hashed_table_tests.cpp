// tests/hashed_table_tests.cpp
#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <blobmap/errors.hpp>
#include <blobmap/hash.hpp>
#include <blobmap/hashed_table.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace blobmap;

using Entries = std::vector<std::pair<std::string, int32_t>>;

// ----------------- helpers -----------------
static Entries java_classes() {
  Entries e;
  for (int32_t i = 0; i < 40; ++i) e.emplace_back("JavaClass" + std::to_string(i), i);
  e.emplace_back("OtherJavaClass1", 40);
  return e;
}

static Entries random_entries(size_t n, uint32_t seed) {
  std::mt19937 rng(seed);
  std::map<std::string, int32_t> m;
  while (m.size() < n) {
    std::string k = "k" + std::to_string(rng()) + "_" + std::to_string(m.size());
    m.emplace(std::move(k), static_cast<int32_t>(rng()));
  }
  return Entries(m.begin(), m.end());
}

static bool is_prime(uint32_t x) {
  if (x < 2) return false;
  for (uint32_t d = 2; d * d <= x; ++d)
    if (x % d == 0) return false;
  return true;
}

TEST_CASE("hashed: JavaClass table finds JavaClass33") {
  spdlog::set_level(spdlog::level::warn);

  auto compiled = compile_hashed(java_classes());
  HashedTable t(compiled.blob);

  REQUIRE(t.size() == 41);
  REQUIRE(t.find("JavaClass33") == 33);
  REQUIRE(t.find("OtherJavaClass1") == 40);
  REQUIRE_FALSE(t.find("Unknown").has_value());
  REQUIRE_FALSE(t.contains("JavaClass40"));
  REQUIRE(t.contains("JavaClass0"));
}

TEST_CASE("hashed: keys-only compile assigns input positions") {
  std::vector<std::string> keys;
  for (const auto& [k, v] : java_classes()) keys.push_back(k);

  auto by_keys = compile_hashed_keys(keys);
  auto by_entries = compile_hashed(java_classes());
  REQUIRE(by_keys.blob == by_entries.blob);

  HashedTable t(by_keys.blob);
  for (size_t i = 0; i < keys.size(); ++i) REQUIRE(t.find(keys[i]) == static_cast<int32_t>(i));
}

TEST_CASE("hashed: compiled index and loaded table agree") {
  const auto entries = random_entries(5000, 42);
  auto compiled = compile_hashed(entries);
  HashedTable t(compiled.blob, LoadOptions{.verify_keys = true});

  REQUIRE(compiled.index.size() == entries.size());
  for (const auto& [k, v] : entries) {
    REQUIRE(compiled.index.at(k) == v);
    REQUIRE(t.find(k) == v);
  }
  for (int i = 0; i < 1000; ++i) {
    const std::string absent = "absent_" + std::to_string(i);
    REQUIRE_FALSE(t.find(absent).has_value());
  }
}

TEST_CASE("hashed: every entry lives in the bucket its hash selects") {
  auto compiled = compile_hashed(random_entries(777, 3));
  HashedTable t(compiled.blob);

  int32_t expected_start = 0;
  for (uint32_t b = 0; b < t.bucket_count(); ++b) {
    const Bucket bk = t.bucket(b);
    REQUIRE(bk.start == expected_start); // бакеты идут подряд
    for (int32_t i = bk.start; i < bk.end; ++i) {
      REQUIRE(fast_mod(static_cast<uint32_t>(t.hash_at(i)), t.bucket_count(),
                       t.fast_mod_multiplier()) == b);
      REQUIRE(t.bucket_of(t.key_at(i)) == b);
    }
    expected_start = bk.end;
  }
  REQUIRE(expected_start == t.size());
  REQUIRE(t.fast_mod_multiplier() == fast_mod_multiplier(t.bucket_count()));
  REQUIRE(t.max_bucket_size() >= 1);
}

TEST_CASE("hashed: blob does not depend on input order") {
  auto entries = random_entries(1500, 17);
  const auto reference = compile_hashed(entries).blob;

  std::mt19937 rng(1);
  for (int i = 0; i < 5; ++i) {
    std::shuffle(entries.begin(), entries.end(), rng);
    REQUIRE(compile_hashed(entries).blob == reference);
  }
}

TEST_CASE("hashed: arbitrary values, including negative and repeated") {
  const Entries entries = {{"x", -7}, {"y", -7}, {"z", 0}, {"w", 2147483647}, {"v", -2147483647 - 1}};
  auto compiled = compile_hashed(entries);
  HashedTable t(compiled.blob);
  for (const auto& [k, v] : entries) REQUIRE(t.find(k) == v);

  std::map<std::string, int32_t> seen;
  for (const Entry e : t) seen.emplace(std::string(e.key), e.value);
  REQUIRE(seen == std::map<std::string, int32_t>(entries.begin(), entries.end()));
}

TEST_CASE("hashed: empty table has one empty bucket") {
  auto compiled = compile_hashed(Entries{});
  HashedTable t(compiled.blob);
  REQUIRE(t.empty());
  REQUIRE(t.bucket_count() == 1);
  REQUIRE(t.bucket(0).size() == 0);
  REQUIRE_FALSE(t.find("anything").has_value());
  REQUIRE(t.begin() == t.end());
}

TEST_CASE("hashed: duplicates rejected even with different values") {
  const Entries entries = {{"a", 1}, {"b", 2}, {"a", 3}};
  REQUIRE_THROWS_AS(compile_hashed(entries), DuplicateKey);
  REQUIRE_THROWS_AS(compile_hashed(Entries{{"", 1}}), InvalidKey);
}

TEST_CASE("choose_bucket_count policy") {
  REQUIRE(choose_bucket_count({}) == 1);

  const std::vector<uint32_t> five = {1, 2, 3, 4, 5};
  // любая доля коллизий приемлема -> первое простое >= 2n
  REQUIRE(choose_bucket_count(five, CompileOptions{.max_collision_rate = 1.0}) == 11);
  REQUIRE(choose_bucket_count(five, CompileOptions{.max_candidates = 1}) == 11);

  std::mt19937 rng(9);
  std::vector<uint32_t> codes;
  for (int i = 0; i < 300; ++i) codes.push_back(rng());
  std::sort(codes.begin(), codes.end());
  codes.erase(std::unique(codes.begin(), codes.end()), codes.end());
  const uint32_t n = static_cast<uint32_t>(codes.size());

  const uint32_t b = choose_bucket_count(codes);
  REQUIRE(is_prime(b));
  REQUIRE(b >= 2 * n);
  REQUIRE(b <= 16 * n);
}
