#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blobmap {

struct KeyLine {
  std::string key;
  std::optional<int32_t> value; // задано через "key<TAB>value"
};

// Список ключей для компиляции: одна строка = один ключ, пустые строки
// пропускаются, завершающий '\r' срезается. Для hashed-таблиц строка
// "key\tvalue" задаёт значение явно.
bool read_key_list(const std::string& path, std::vector<KeyLine>& out, std::string* err);

} // namespace blobmap
