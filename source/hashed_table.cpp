#include <blobmap/byte_io.hpp>
#include <blobmap/errors.hpp>
#include <blobmap/hash.hpp>
#include <blobmap/hashed_table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace blobmap {

HashedTable::HashedTable(std::span<const uint8_t> blob, const LoadOptions& opts) {
  const Preamble pre = read_preamble(blob, BlobKind::Hashed);

  BlobCursor cur(blob.subspan(kPreambleSize));
  const int32_t count = cur.take_i32("item count");
  if (count < 0) {
    throw MalformedBlob(BlobDefect::Length, fmt::format("negative item count {}", count));
  }

  const uint64_t n = static_cast<uint64_t>(count);
  hashes_ = cur.take(4 * n, "key hashes");
  const uint8_t* offsets = cur.take(4 * n, "key offsets");
  values_ = cur.take(4 * n, "values");

  const int32_t buckets = cur.take_i32("bucket count");
  if (buckets < 1) {
    throw MalformedBlob(BlobDefect::Buckets, fmt::format("bucket count {}", buckets));
  }
  bucket_count_ = static_cast<uint32_t>(buckets);
  buckets_ = cur.take(kBucketSize * bucket_count_, "buckets");
  multiplier_ = cur.take_u64("fast mod multiplier");

  if (cur.remaining() != static_cast<size_t>(pre.keys_length)) {
    throw MalformedBlob(BlobDefect::Length,
                        fmt::format("keys region is {} bytes, header says {}",
                                    cur.remaining(), pre.keys_length));
  }

  keys_ = KeyColumn(offsets, count, cur.rest(), pre.keys_length);
  count_ = count;
  keys_.validate();

  if (multiplier_ != blobmap::fast_mod_multiplier(bucket_count_)) {
    throw MalformedBlob(BlobDefect::Buckets,
                        fmt::format("multiplier {} does not belong to {} buckets",
                                    multiplier_, bucket_count_));
  }
  validate_buckets();

  if (opts.verify_keys) {
    for (int32_t i = 0; i < count_; ++i) {
      if (key_hash(key_at(i)) != hash_at(i)) {
        throw MalformedBlob(BlobDefect::KeyHash,
                            fmt::format("entry {}: stored hash does not match key", i));
      }
    }
  }

  spdlog::debug("hashed table loaded: {} items, {} buckets, {} key bytes",
                count_, bucket_count_, pre.keys_length);
}

// Каждый бакет внутри [0, n]; каждая запись бакета b даёт fast_mod == b.
// Пересечение двух бакетов этим исключено (запись не может попасть в два
// бакета сразу), а сумма размеров == n гарантирует покрытие всех записей.
void HashedTable::validate_buckets() const {
  uint64_t covered = 0;
  for (uint32_t b = 0; b < bucket_count_; ++b) {
    const Bucket bk = bucket(b);
    if (bk.start < 0 || bk.start > bk.end || bk.end > count_) {
      throw MalformedBlob(BlobDefect::Buckets,
                          fmt::format("bucket {} range [{}, {}) outside [0, {}]",
                                      b, bk.start, bk.end, count_));
    }
    for (int32_t i = bk.start; i < bk.end; ++i) {
      const uint32_t owner = fast_mod(static_cast<uint32_t>(hash_at(i)),
                                      bucket_count_, multiplier_);
      if (owner != b) {
        throw MalformedBlob(BlobDefect::Buckets,
                            fmt::format("entry {} sits in bucket {} but hashes to {}",
                                        i, b, owner));
      }
    }
    covered += static_cast<uint64_t>(bk.size());
  }
  if (covered != static_cast<uint64_t>(count_)) {
    throw MalformedBlob(BlobDefect::Buckets,
                        fmt::format("buckets cover {} entries of {}", covered, count_));
  }
}

int32_t HashedTable::hash_at(int32_t i) const noexcept {
  return load_i32(hashes_ + 4 * static_cast<size_t>(i));
}

int32_t HashedTable::value_at(int32_t i) const noexcept {
  return load_i32(values_ + 4 * static_cast<size_t>(i));
}

Bucket HashedTable::bucket(uint32_t b) const noexcept {
  const uint8_t* p = buckets_ + kBucketSize * static_cast<size_t>(b);
  return Bucket{load_i32(p), load_i32(p + 4)};
}

uint32_t HashedTable::bucket_of(std::string_view key) const noexcept {
  return fast_mod(static_cast<uint32_t>(key_hash(key)), bucket_count_, multiplier_);
}

int32_t HashedTable::max_bucket_size() const noexcept {
  int32_t best = 0;
  for (uint32_t b = 0; b < bucket_count_; ++b) best = std::max(best, bucket(b).size());
  return best;
}

std::optional<int32_t> HashedTable::find(std::string_view key) const noexcept {
  const int32_t hash = key_hash(key);
  const Bucket bk = bucket(fast_mod(static_cast<uint32_t>(hash), bucket_count_, multiplier_));

  for (int32_t i = bk.start; i < bk.end; ++i) {
    if (hash_at(i) != hash) continue;
    if (key_at(i) == key) return value_at(i);
  }
  return std::nullopt;
}

} // namespace blobmap
