#include <blobmap/mapped_blob.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace blobmap {

MappedBlob::MappedBlob(MappedBlob&& o) noexcept
    : path_(std::move(o.path_)), map_base_(o.map_base_), map_len_(o.map_len_),
      opened_(o.opened_) {
  o.map_base_ = nullptr;
  o.map_len_  = 0;
  o.opened_   = false;
}

MappedBlob& MappedBlob::operator=(MappedBlob&& o) noexcept {
  if (this != &o) {
    close();
    path_     = std::move(o.path_);
    map_base_ = std::exchange(o.map_base_, nullptr);
    map_len_  = std::exchange(o.map_len_, 0);
    opened_   = std::exchange(o.opened_, false);
  }
  return *this;
}

bool MappedBlob::open(const std::string& path) {
  close();
  path_ = path;

  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    spdlog::error("blob open failed: {} (errno={})", path, errno);
    return false;
  }

  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    spdlog::error("blob stat failed: {} (errno={})", path, errno);
    ::close(fd);
    return false;
  }

  const size_t len = static_cast<size_t>(st.st_size);
  if (len == 0) {
    // mmap нулевой длины невозможен; пустой блоб отвергнет загрузчик
    ::close(fd);
    opened_ = true;
    return true;
  }

  void* p = ::mmap(nullptr, len, PROT_READ, MAP_SHARED, fd, 0);
  // отображение держит файл само, дескриптор больше не нужен
  ::close(fd);
  if (p == MAP_FAILED) {
    spdlog::error("blob mmap failed: {} (errno={})", path, errno);
    return false;
  }

  map_base_ = p;
  map_len_  = len;
  opened_   = true;
  return true;
}

void MappedBlob::close() {
  if (map_base_) {
    ::munmap(map_base_, map_len_);
  }
  map_base_ = nullptr;
  map_len_  = 0;
  opened_   = false;
}

bool write_blob_file(const std::string& path, std::span<const uint8_t> blob) {
  int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    spdlog::error("blob create failed: {} (errno={})", path, errno);
    return false;
  }

  const uint8_t* ptr = blob.data();
  size_t left = blob.size();
  while (left > 0) {
    ssize_t w = ::write(fd, ptr, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      spdlog::error("blob write failed: {} (errno={})", path, errno);
      ::close(fd);
      return false;
    }
    ptr  += w;
    left -= static_cast<size_t>(w);
  }

  if (::fsync(fd) != 0) {
    spdlog::error("blob fsync failed: {} (errno={})", path, errno);
    ::close(fd);
    return false;
  }
  ::close(fd);
  spdlog::debug("wrote {} bytes to {}", blob.size(), path);
  return true;
}

} // namespace blobmap
