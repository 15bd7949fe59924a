#pragma once
#include <blobmap/entry.hpp>
#include <blobmap/format.hpp>
#include <blobmap/key_column.hpp>
#include <blobmap/options.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blobmap {

// Хеш-таблица с бакетами поверх блоба kind == Hashed (раскладка frozen-словаря):
// бакет выбирается fast_mod(hash), записи бакета лежат подряд,
// внутри бакета линейный проход: сначала сравнение хеша, потом байт.
//
// Как и SortedTable, только ссылается на байты блоба.
class HashedTable {
public:
  using const_iterator = EntryIterator<HashedTable>;

  // Бросает MalformedBlob, если блоб не проходит проверки.
  explicit HashedTable(std::span<const uint8_t> blob, const LoadOptions& opts = {});

  int32_t size() const noexcept { return count_; }
  bool empty() const noexcept { return count_ == 0; }

  std::optional<int32_t> find(std::string_view key) const noexcept;
  bool contains(std::string_view key) const noexcept { return find(key).has_value(); }

  std::string_view key_at(int32_t i) const noexcept { return keys_.key(i); }
  int32_t value_at(int32_t i) const noexcept;
  int32_t hash_at(int32_t i) const noexcept;

  // ---- diagnostics ----
  uint32_t bucket_count() const noexcept { return bucket_count_; }
  Bucket bucket(uint32_t b) const noexcept;
  uint32_t bucket_of(std::string_view key) const noexcept;
  int32_t max_bucket_size() const noexcept;
  uint64_t fast_mod_multiplier() const noexcept { return multiplier_; }
  int32_t keys_length() const noexcept { return keys_.keys_length(); }

  const_iterator begin() const noexcept { return {this, 0}; }
  const_iterator end() const noexcept { return {this, count_}; }

private:
  void validate_buckets() const;

  const uint8_t* hashes_  = nullptr;
  const uint8_t* values_  = nullptr;
  const uint8_t* buckets_ = nullptr;
  KeyColumn      keys_;
  int32_t        count_ = 0;
  uint32_t       bucket_count_ = 0;
  uint64_t       multiplier_ = 0;
};

// Число бакетов для набора (уникальных) хешей по политике CompileOptions.
// Для пустого набора 1.
uint32_t choose_bucket_count(const std::vector<uint32_t>& unique_hashes,
                             const CompileOptions& opts = {});

// Ключи различны и непусты; значения произвольные.
// Блоб зависит только от множества пар, не от порядка входа.
CompiledTable compile_hashed(const std::vector<std::pair<std::string, int32_t>>& entries,
                             const CompileOptions& opts = {});

// Значение ключа = его позиция во входном списке.
CompiledTable compile_hashed_keys(const std::vector<std::string>& keys,
                                  const CompileOptions& opts = {});

} // namespace blobmap
