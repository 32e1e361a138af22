#pragma once
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tu {

// Forward-only, read-once origin of bytes.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to `n` bytes into `dst`. Returns 0 at end of source.
  // On failure returns 0 and sets `ec`.
  virtual std::size_t read(char* dst, std::size_t n, std::error_code& ec) = 0;
};

class FileSource final : public ByteSource {
public:
  static std::unique_ptr<FileSource> open(const std::string& path, std::error_code& ec);

  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::size_t read(char* dst, std::size_t n, std::error_code& ec) override;

private:
  explicit FileSource(std::FILE* f) : f_(f) {}
  std::FILE* f_{nullptr};
};

class MemorySource final : public ByteSource {
public:
  // Borrowed: `bytes` must outlive the source.
  explicit MemorySource(std::string_view bytes) : view_(bytes) {}
  // Owned.
  explicit MemorySource(std::string bytes) : owned_(std::move(bytes)), view_(owned_) {}

  MemorySource(const MemorySource&) = delete;
  MemorySource& operator=(const MemorySource&) = delete;

  std::size_t read(char* dst, std::size_t n, std::error_code& ec) override;

  std::size_t size() const noexcept { return view_.size(); }

private:
  std::string owned_;
  std::string_view view_;
  std::size_t offset_{0};
};

}
