#include <blobmap/byte_io.hpp>
#include <blobmap/hash.hpp>
#include <blobmap/sorted_table.hpp>

#include "compile_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace blobmap {

CompiledTable compile_sorted(const std::vector<std::string>& keys) {
  std::vector<HashedKey> sorted;
  sorted.reserve(keys.size());
  for (const auto& k : keys) sorted.emplace_back(k);
  std::sort(sorted.begin(), sorted.end());

  detail::check_keys(sorted.begin(), sorted.end(),
                     [](const HashedKey& h) { return h.key; });

  int32_t keys_length = 0;
  for (const auto& h : sorted) keys_length += static_cast<int32_t>(h.key.size());
  const auto count = static_cast<int32_t>(sorted.size());

  BlobWriter w;
  w.reserve(kPreambleSize + 4 + 8 * sorted.size() + static_cast<size_t>(keys_length));
  detail::put_preamble(w, BlobKind::Sorted, keys_length);
  w.put_i32(count);
  for (const auto& h : sorted) w.put_i32(h.hash);

  int32_t offset = 0;
  for (const auto& h : sorted) {
    w.put_i32(offset);
    offset += static_cast<int32_t>(h.key.size());
  }
  for (const auto& h : sorted) w.put_bytes(h.key);

  CompiledTable out;
  out.index.reserve(sorted.size());
  for (int32_t i = 0; i < count; ++i) {
    const auto& h = sorted[static_cast<size_t>(i)];
    spdlog::trace("sorted entry {}: hash={} len={}", i, h.hash, h.key.size());
    out.index.emplace(std::string(h.key), i);
  }
  out.blob = w.take();

  spdlog::debug("compiled sorted table: {} items, {} key bytes, blob {} bytes",
                count, keys_length, out.blob.size());
  return out;
}

} // namespace blobmap
