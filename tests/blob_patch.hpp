// tests/blob_patch.hpp
#pragma once
#include <blobmap/format.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

// Смещения полей блоба для тестов порчи (см. раскладку в format.hpp).
namespace blob_patch {

inline constexpr size_t kCount = blobmap::kPreambleSize;
inline constexpr size_t kArrays = kCount + 4;

inline size_t sorted_hash(int32_t n, int32_t i) { (void)n; return kArrays + 4 * size_t(i); }
inline size_t sorted_offset(int32_t n, int32_t i) { return kArrays + 4 * size_t(n) + 4 * size_t(i); }

inline size_t hashed_hash(int32_t n, int32_t i) { (void)n; return kArrays + 4 * size_t(i); }
inline size_t hashed_offset(int32_t n, int32_t i) { return kArrays + 4 * size_t(n) + 4 * size_t(i); }
inline size_t hashed_value(int32_t n, int32_t i) { return kArrays + 8 * size_t(n) + 4 * size_t(i); }
inline size_t hashed_bucket_count(int32_t n) { return kArrays + 12 * size_t(n); }
inline size_t hashed_bucket(int32_t n, uint32_t b) { return hashed_bucket_count(n) + 4 + 8 * size_t(b); }
inline size_t hashed_multiplier(int32_t n, uint32_t buckets) { return hashed_bucket(n, buckets); }

inline int32_t get_i32(const std::vector<uint8_t>& b, size_t pos) {
  return static_cast<int32_t>(uint32_t(b[pos]) | uint32_t(b[pos + 1]) << 8 |
                              uint32_t(b[pos + 2]) << 16 | uint32_t(b[pos + 3]) << 24);
}

inline void put_i32(std::vector<uint8_t>& b, size_t pos, int32_t v) {
  const auto u = static_cast<uint32_t>(v);
  for (int i = 0; i < 4; ++i) b[pos + size_t(i)] = static_cast<uint8_t>(u >> (8 * i));
}

inline void put_u16(std::vector<uint8_t>& b, size_t pos, uint16_t v) {
  b[pos] = static_cast<uint8_t>(v);
  b[pos + 1] = static_cast<uint8_t>(v >> 8);
}

} // namespace blob_patch
