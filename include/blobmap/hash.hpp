#pragma once
#include <cstdint>
#include <string_view>

namespace blobmap {

// Хеш ключа: младшие 32 бита XXH3_64bits(key, seed=0), как signed int32.
// Компилятор и загрузчик обязаны считать его одинаково; смена алгоритма
// требует поднять kBlobVersion.
int32_t key_hash(std::string_view key) noexcept;

// Единственный порядок в системе: хеш (signed), затем байты ключа
// лексикографически как unsigned (префикс меньше).
inline int compare_keys(int32_t a_hash, std::string_view a,
                        int32_t b_hash, std::string_view b) noexcept {
  if (a_hash != b_hash) return a_hash < b_hash ? -1 : 1;
  const int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

// Ключ с заранее посчитанным хешем (чтобы сортировка не хешировала повторно).
struct HashedKey {
  int32_t hash = 0;
  std::string_view key;

  HashedKey() = default;
  explicit HashedKey(std::string_view k) : hash(key_hash(k)), key(k) {}

  friend bool operator<(const HashedKey& a, const HashedKey& b) noexcept {
    return compare_keys(a.hash, a.key, b.hash, b.key) < 0;
  }
  friend bool operator==(const HashedKey& a, const HashedKey& b) noexcept {
    return a.hash == b.hash && a.key == b.key;
  }
};

// ---- fast modular reduction ----
// multiplier = floor((2^64 - 1) / divisor) + 1, считается один раз на таблицу.
// fast_mod(v) == v % divisor для любого 32-битного v при divisor <= INT32_MAX.

inline uint64_t fast_mod_multiplier(uint32_t divisor) noexcept {
  return UINT64_MAX / divisor + 1;
}

inline uint32_t fast_mod(uint32_t value, uint32_t divisor,
                         uint64_t multiplier) noexcept {
  return static_cast<uint32_t>(
      ((((multiplier * value) >> 32) + 1) * divisor) >> 32);
}

} // namespace blobmap
