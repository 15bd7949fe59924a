#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace blobmap {

// ---- Read-only mmap of a whole blob file ----
// Таблицы, построенные поверх bytes(), должны умереть раньше MappedBlob.
class MappedBlob {
public:
  MappedBlob() = default;
  ~MappedBlob() { close(); }

  MappedBlob(const MappedBlob&) = delete;
  MappedBlob& operator=(const MappedBlob&) = delete;

  MappedBlob(MappedBlob&& o) noexcept;
  MappedBlob& operator=(MappedBlob&& o) noexcept;

  // false + spdlog::error, если файл не открылся / не отобразился.
  bool open(const std::string& path);
  void close();

  bool good() const { return opened_; }
  const std::string& path() const { return path_; }

  std::span<const uint8_t> bytes() const {
    return {static_cast<const uint8_t*>(map_base_), map_len_};
  }

private:
  std::string path_;
  void*       map_base_ = nullptr;
  size_t      map_len_  = 0;
  bool        opened_   = false; // пустой файл: opened_ без отображения
};

// Записать блоб целиком и сделать fsync. false + spdlog::error при ошибке.
bool write_blob_file(const std::string& path, std::span<const uint8_t> blob);

} // namespace blobmap
