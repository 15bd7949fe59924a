#include <blobmap/byte_io.hpp>
#include <blobmap/errors.hpp>
#include <blobmap/format.hpp>
#include <blobmap/hash.hpp>
#include <blobmap/sorted_table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace blobmap {

SortedTable::SortedTable(std::span<const uint8_t> blob, const LoadOptions& opts) {
  const Preamble pre = read_preamble(blob, BlobKind::Sorted);

  BlobCursor cur(blob.subspan(kPreambleSize));
  const int32_t count = cur.take_i32("item count");
  if (count < 0) {
    throw MalformedBlob(BlobDefect::Length, fmt::format("negative item count {}", count));
  }

  const uint64_t n = static_cast<uint64_t>(count);
  hashes_ = cur.take(4 * n, "hashes");
  const uint8_t* offsets = cur.take(4 * n, "key offsets");

  if (cur.remaining() != static_cast<size_t>(pre.keys_length)) {
    throw MalformedBlob(BlobDefect::Length,
                        fmt::format("keys region is {} bytes, header says {}",
                                    cur.remaining(), pre.keys_length));
  }

  keys_ = KeyColumn(offsets, count, cur.rest(), pre.keys_length);
  count_ = count;
  keys_.validate();

  // Неубывание хешей проверяем всегда: без него бинарный поиск врёт молча.
  for (int32_t i = 1; i < count_; ++i) {
    if (hash_at(i - 1) > hash_at(i)) {
      throw MalformedBlob(BlobDefect::Order,
                          fmt::format("hashes[{}] > hashes[{}]", i - 1, i));
    }
  }

  if (opts.verify_keys) {
    for (int32_t i = 0; i < count_; ++i) {
      const std::string_view k = key_at(i);
      if (key_hash(k) != hash_at(i)) {
        throw MalformedBlob(BlobDefect::KeyHash,
                            fmt::format("entry {}: stored hash does not match key", i));
      }
      if (i > 0 && compare_keys(hash_at(i - 1), key_at(i - 1), hash_at(i), k) >= 0) {
        throw MalformedBlob(BlobDefect::Order,
                            fmt::format("entries {} and {} out of (hash, key) order", i - 1, i));
      }
    }
  }

  spdlog::debug("sorted table loaded: {} items, {} key bytes", count_, pre.keys_length);
}

int32_t SortedTable::hash_at(int32_t i) const noexcept {
  return load_i32(hashes_ + 4 * static_cast<size_t>(i));
}

int SortedTable::compare_at(std::string_view key, int32_t hash, int32_t i) const noexcept {
  return compare_keys(hash, key, hash_at(i), key_at(i));
}

int32_t SortedTable::index_of(std::string_view key) const noexcept {
  const int32_t hash = key_hash(key);

  int32_t lo = 0;
  int32_t hi = count_ - 1;
  while (lo <= hi) {
    // lo, hi >= 0 и <= INT32_MAX: сумма в uint32 не переполняется
    const int32_t mid = static_cast<int32_t>(
        (static_cast<uint32_t>(lo) + static_cast<uint32_t>(hi)) >> 1);
    const int c = compare_at(key, hash, mid);
    if (c == 0) return mid;
    if (c > 0) lo = mid + 1;
    else hi = mid - 1;
  }
  return ~lo;
}

std::optional<int32_t> SortedTable::find(std::string_view key) const noexcept {
  const int32_t i = index_of(key);
  if (i < 0) return std::nullopt;
  return i;
}

} // namespace blobmap
