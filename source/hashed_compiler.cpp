#include <blobmap/byte_io.hpp>
#include <blobmap/hash.hpp>
#include <blobmap/hashed_table.hpp>

#include "compile_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace blobmap {

// ---- primes ----
static bool is_prime(uint64_t x) {
  if (x < 2) return false;
  if (x % 2 == 0) return x == 2;
  for (uint64_t d = 3; d * d <= x; d += 2)
    if (x % d == 0) return false;
  return true;
}

static uint64_t next_prime(uint64_t x) {
  while (!is_prime(x)) ++x;
  return x;
}

uint32_t choose_bucket_count(const std::vector<uint32_t>& unique_hashes,
                             const CompileOptions& opts) {
  const uint64_t n = unique_hashes.size();
  if (n == 0) return 1;

  constexpr uint64_t kMaxBuckets = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
  const uint64_t mult = n >= opts.large_table_threshold ? opts.large_table_multiplier
                                                        : opts.small_table_multiplier;
  const uint64_t min_buckets = std::min(kMaxBuckets, n * 2);
  const uint64_t max_buckets = std::min(kMaxBuckets, std::max(min_buckets, n * mult));
  const uint64_t acceptable = static_cast<uint64_t>(opts.max_collision_rate * static_cast<double>(n));

  std::vector<uint8_t> seen;
  uint64_t best = 0;
  uint64_t best_collisions = n;
  uint32_t tried = 0;

  for (uint64_t p = next_prime(min_buckets); p <= max_buckets && tried < opts.max_candidates;
       p = next_prime(p + 1), ++tried) {
    seen.assign(static_cast<size_t>(p), 0);
    uint64_t collisions = 0;
    for (uint32_t h : unique_hashes) {
      const uint64_t b = h % p;
      if (seen[b]) {
        if (++collisions >= best_collisions) break;
      } else {
        seen[b] = 1;
      }
    }
    if (collisions < best_collisions) {
      best = p;
      best_collisions = collisions;
      if (collisions <= acceptable) break;
    }
  }

  // Кандидатов не нашлось (диапазон упёрся в INT32_MAX): берём нижнюю границу.
  if (best == 0) best = std::min(kMaxBuckets, next_prime(min_buckets));
  return static_cast<uint32_t>(best);
}

namespace {

struct Item {
  HashedKey hk;
  int32_t value = 0;
  uint32_t bucket = 0;
};

} // namespace

CompiledTable compile_hashed(const std::vector<std::pair<std::string, int32_t>>& entries,
                             const CompileOptions& opts) {
  // Порядок сборки = порядок (hash, bytes): блоб не зависит от порядка входа.
  std::vector<Item> items;
  items.reserve(entries.size());
  for (const auto& [k, v] : entries) items.push_back(Item{HashedKey(k), v, 0});
  std::sort(items.begin(), items.end(),
            [](const Item& a, const Item& b) { return a.hk < b.hk; });

  detail::check_keys(items.begin(), items.end(),
                     [](const Item& it) { return it.hk.key; });

  std::vector<uint32_t> codes;
  codes.reserve(items.size());
  for (const auto& it : items) {
    const auto h = static_cast<uint32_t>(it.hk.hash);
    if (codes.empty() || codes.back() != h) codes.push_back(h);
  }
  // items отсортированы по signed-хешу, одинаковые хеши стоят подряд
  const uint32_t bucket_count = choose_bucket_count(codes, opts);
  const uint64_t multiplier = fast_mod_multiplier(bucket_count);

  for (auto& it : items)
    it.bucket = fast_mod(static_cast<uint32_t>(it.hk.hash), bucket_count, multiplier);
  std::stable_sort(items.begin(), items.end(),
                   [](const Item& a, const Item& b) { return a.bucket < b.bucket; });

  std::vector<Bucket> buckets(bucket_count);
  {
    size_t i = 0;
    for (uint32_t b = 0; b < bucket_count; ++b) {
      buckets[b].start = static_cast<int32_t>(i);
      while (i < items.size() && items[i].bucket == b) ++i;
      buckets[b].end = static_cast<int32_t>(i);
    }
  }

  int32_t keys_length = 0;
  for (const auto& it : items) keys_length += static_cast<int32_t>(it.hk.key.size());
  const auto count = static_cast<int32_t>(items.size());

  BlobWriter w;
  w.reserve(kPreambleSize + 4 + 12 * items.size() + 4 + kBucketSize * buckets.size() + 8 +
            static_cast<size_t>(keys_length));
  detail::put_preamble(w, BlobKind::Hashed, keys_length);
  w.put_i32(count);
  for (const auto& it : items) w.put_i32(it.hk.hash);
  int32_t offset = 0;
  for (const auto& it : items) {
    w.put_i32(offset);
    offset += static_cast<int32_t>(it.hk.key.size());
  }
  for (const auto& it : items) w.put_i32(it.value);
  w.put_i32(static_cast<int32_t>(bucket_count));
  for (const auto& b : buckets) {
    w.put_i32(b.start);
    w.put_i32(b.end);
  }
  w.put_u64(multiplier);
  for (const auto& it : items) w.put_bytes(it.hk.key);

  CompiledTable out;
  out.index.reserve(items.size());
  for (const auto& it : items) out.index.emplace(std::string(it.hk.key), it.value);
  out.blob = w.take();

  int32_t largest = 0;
  for (const auto& b : buckets) largest = std::max(largest, b.size());
  spdlog::debug("compiled hashed table: {} items, {} buckets (largest {}), blob {} bytes",
                count, bucket_count, largest, out.blob.size());
  return out;
}

CompiledTable compile_hashed_keys(const std::vector<std::string>& keys,
                                  const CompileOptions& opts) {
  std::vector<std::pair<std::string, int32_t>> entries;
  entries.reserve(keys.size());
  for (size_t i = 0; i < keys.size(); ++i)
    entries.emplace_back(keys[i], static_cast<int32_t>(i));
  return compile_hashed(entries, opts);
}

} // namespace blobmap
