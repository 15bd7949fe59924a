#pragma once
#include <cstdint>

namespace blobmap {

// Политика выбора числа бакетов для HashedTable.
// Кандидаты: простые числа от 2n до n * multiplier. Берём первое, у которого
// доля коллизий бакетов <= max_collision_rate; иначе то, где коллизий меньше всего.
struct CompileOptions {
  double   max_collision_rate     = 0.05;
  uint32_t small_table_multiplier = 16;
  uint32_t large_table_multiplier = 3;
  uint32_t large_table_threshold  = 1000; // n >= threshold -> large_table_multiplier
  uint32_t max_candidates         = 64;   // сколько простых перебрать максимум
};

struct LoadOptions {
  // Пересчитать хеш каждого ключа и проверить строгий порядок (sorted).
  // Стоит O(суммарной длины ключей), поэтому по умолчанию выключено.
  bool verify_keys = false;
};

} // namespace blobmap
