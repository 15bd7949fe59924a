#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace blobmap {

// Какой инвариант блоба нарушен.
enum class BlobDefect {
  Header,  // magic / version / kind
  Length,  // блоб короче (или длиннее), чем говорит заголовок
  Offsets, // keyOffsets не монотонны или выходят за keysBlob
  Order,   // хеши (или ключи) не отсортированы
  Buckets, // диапазоны бакетов, multiplier, принадлежность записей
  KeyHash, // сохранённый хеш не совпал с пересчитанным (verify_keys)
};

const char* to_string(BlobDefect d) noexcept;

// Блоб не прошёл проверку при загрузке. Частичной таблицы не бывает.
class MalformedBlob : public std::runtime_error {
public:
  MalformedBlob(BlobDefect defect, const std::string& detail);

  BlobDefect defect() const noexcept { return defect_; }

private:
  BlobDefect defect_;
};

// Один и тот же ключ передан компилятору дважды.
class DuplicateKey : public std::invalid_argument {
public:
  explicit DuplicateKey(std::string_view key);

  const std::string& key() const noexcept { return key_; }

private:
  std::string key_;
};

// Пустой ключ или таблица, не адресуемая int32.
class InvalidKey : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace blobmap
