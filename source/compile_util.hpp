#pragma once
#include <blobmap/byte_io.hpp>
#include <blobmap/errors.hpp>
#include <blobmap/format.hpp>

#include <cstdint>
#include <limits>
#include <string_view>

#include <fmt/format.h>

namespace blobmap::detail {

// Вход уже отсортирован по (hash, bytes): дубликаты стоят рядом.
template <class It, class KeyOf>
void check_keys(It first, It last, KeyOf key_of) {
  uint64_t total = 0;
  for (It it = first; it != last; ++it) {
    const std::string_view k = key_of(*it);
    if (k.empty()) throw InvalidKey("empty key");
    if (it != first && key_of(*(it - 1)) == k) throw DuplicateKey(k);
    total += k.size();
  }
  constexpr uint64_t kMax = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
  if (static_cast<uint64_t>(last - first) > kMax)
    throw InvalidKey(fmt::format("{} entries do not fit int32", last - first));
  if (total > kMax)
    throw InvalidKey(fmt::format("{} key bytes do not fit int32", total));
}

inline void put_preamble(BlobWriter& w, BlobKind kind, int32_t keys_length) {
  w.put_u32(kBlobMagic);
  w.put_u16(kBlobVersion);
  w.put_u16(static_cast<uint16_t>(kind));
  w.put_i32(keys_length);
}

} // namespace blobmap::detail
