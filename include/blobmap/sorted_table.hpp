#pragma once
#include <blobmap/entry.hpp>
#include <blobmap/key_column.hpp>
#include <blobmap/options.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blobmap {

// Таблица бинарного поиска поверх блоба kind == Sorted.
// Значение ключа = его позиция в порядке (hash, bytes).
//
// Таблица только ссылается на байты блоба: владелец буфера (vector,
// MappedBlob, статический массив) должен жить дольше неё.
// После конструктора все методы только читают, их можно звать из любых потоков.
class SortedTable {
public:
  using const_iterator = EntryIterator<SortedTable>;

  // Бросает MalformedBlob, если блоб не проходит проверки.
  explicit SortedTable(std::span<const uint8_t> blob, const LoadOptions& opts = {});

  int32_t size() const noexcept { return count_; }
  bool empty() const noexcept { return count_ == 0; }

  // Индекс ключа, либо ~insertion_point (отрицательное), если ключа нет.
  int32_t index_of(std::string_view key) const noexcept;

  std::optional<int32_t> find(std::string_view key) const noexcept;
  bool contains(std::string_view key) const noexcept { return index_of(key) >= 0; }

  std::string_view key_at(int32_t i) const noexcept { return keys_.key(i); }
  int32_t value_at(int32_t i) const noexcept { return i; }
  int32_t hash_at(int32_t i) const noexcept;

  int32_t keys_length() const noexcept { return keys_.keys_length(); }

  const_iterator begin() const noexcept { return {this, 0}; }
  const_iterator end() const noexcept { return {this, count_}; }

private:
  int compare_at(std::string_view key, int32_t hash, int32_t i) const noexcept;

  const uint8_t* hashes_ = nullptr;
  KeyColumn      keys_;
  int32_t        count_ = 0;
};

// Ключи должны быть различными и непустыми (иначе DuplicateKey / InvalidKey).
// Блоб побайтно одинаков для любой перестановки входа.
CompiledTable compile_sorted(const std::vector<std::string>& keys);

} // namespace blobmap
