#include "trackable_upload/byte_source.hpp"
#include <cerrno>
#include <cstring>

namespace tu {

std::unique_ptr<FileSource> FileSource::open(const std::string& path, std::error_code& ec) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    ec = std::error_code(errno ? errno : EIO, std::generic_category());
    return nullptr;
  }
  ec.clear();
  return std::unique_ptr<FileSource>(new FileSource(f));
}

FileSource::~FileSource() {
  if (f_) std::fclose(f_);
}

std::size_t FileSource::read(char* dst, std::size_t n, std::error_code& ec) {
  if (!f_) { ec = std::make_error_code(std::errc::bad_file_descriptor); return 0; }
  errno = 0;
  std::size_t got = std::fread(dst, 1, n, f_);
  // a short read that also hit an error still hands back its bytes;
  // the error surfaces on the next call
  if (got == 0 && std::ferror(f_)) {
    ec = std::error_code(errno ? errno : EIO, std::generic_category());
    return 0;
  }
  return got;
}

std::size_t MemorySource::read(char* dst, std::size_t n, std::error_code&) {
  if (offset_ >= view_.size() || n == 0) return 0;
  std::size_t left = view_.size() - offset_;
  std::size_t take = left < n ? left : n;
  std::memcpy(dst, view_.data() + offset_, take);
  offset_ += take;
  return take;
}

}
