#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace blobmap {

struct Entry {
  std::string_view key;
  int32_t value = 0;
};

// Результат компиляции: индекс для немедленного использования + блоб,
// кодирующий то же самое отображение.
struct CompiledTable {
  std::unordered_map<std::string, int32_t> index;
  std::vector<uint8_t> blob;
};

// Перебор (key, value) по порядку записей в блобе.
// Table должен давать key_at(i) и value_at(i).
template <class Table>
class EntryIterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using value_type        = Entry;
  using difference_type   = std::ptrdiff_t;
  using pointer           = void;
  using reference         = Entry;

  EntryIterator() = default;
  EntryIterator(const Table* table, int32_t index) : table_(table), index_(index) {}

  Entry operator*() const { return {table_->key_at(index_), table_->value_at(index_)}; }

  EntryIterator& operator++() {
    ++index_;
    return *this;
  }
  EntryIterator operator++(int) {
    EntryIterator prev = *this;
    ++index_;
    return prev;
  }

  bool operator==(const EntryIterator& o) const {
    return table_ == o.table_ && index_ == o.index_;
  }

private:
  const Table* table_ = nullptr;
  int32_t index_ = 0;
};

} // namespace blobmap
