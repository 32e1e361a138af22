#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "trackable_upload/byte_source.hpp"

namespace tu {

// (total size, cumulative bytes read, bytes in this chunk)
using ProgressCallback =
    std::function<void(std::uint64_t total, std::uint64_t sent, std::uint64_t chunk)>;

enum class PullStatus { Chunk, End, Failed };

struct SizeHint {
  std::uint64_t lower = 0;
  std::optional<std::uint64_t> upper;
};

class UploadBody;

// Wraps a ByteSource as a pull-driven sequence of chunks and reports progress
// after every chunk. Consumed once; not safe for concurrent pulls.
class TrackableStream {
public:
  static constexpr std::size_t kDefaultChunkSize = 2048;

  TrackableStream(std::unique_ptr<ByteSource> source, std::uint64_t total_size);

  // Stats then opens `path`. Returns nullopt and sets `ec` if either fails.
  static std::optional<TrackableStream> from_file(const std::string& path, std::error_code& ec);
  // Borrows `bytes`; the caller keeps them alive while the stream is read.
  static TrackableStream from_bytes(std::string_view bytes);
  static TrackableStream from_buffer(std::string bytes);

  TrackableStream(TrackableStream&& other) noexcept;
  TrackableStream& operator=(TrackableStream&& other) noexcept;
  TrackableStream(const TrackableStream&) = delete;
  TrackableStream& operator=(const TrackableStream&) = delete;
  ~TrackableStream();

  TrackableStream with_callback(ProgressCallback cb) &&;
  void set_callback(ProgressCallback cb);

  // Throws std::invalid_argument for 0, std::logic_error once pulling started.
  void set_chunk_size(std::size_t n);
  std::size_t chunk_size() const noexcept;

  std::int64_t  content_length() const noexcept;
  std::uint64_t total_size() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  SizeHint      size_hint() const noexcept;

  // Fills `chunk` with exactly the bytes of the next read.
  // End and Failed are sticky: later pulls repeat them without reading.
  PullStatus pull(std::string& chunk);

  bool finished() const noexcept;
  const std::error_code& error() const noexcept;

  UploadBody to_upload_body() &&;

private:
  struct Impl; Impl* p_;
};

// Transport-facing body: the stream plus its declared length.
class UploadBody {
public:
  explicit UploadBody(TrackableStream stream);

  std::int64_t  content_length() const noexcept { return content_length_; }
  std::uint64_t bytes_sent() const noexcept { return stream_.bytes_read(); }
  const std::error_code& error() const noexcept { return stream_.error(); }

  PullStatus next(std::string& chunk) { return stream_.pull(chunk); }

private:
  TrackableStream stream_;
  std::int64_t content_length_;
};

}
