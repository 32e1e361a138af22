#include "trackable_upload/trackable_stream.hpp"
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace tu {

struct TrackableStream::Impl {
  enum class State { NotStarted, Streaming, Done, Failed };

  std::unique_ptr<ByteSource> source;
  std::uint64_t total{0};
  std::uint64_t read{0};
  std::size_t chunk_bytes{kDefaultChunkSize};
  ProgressCallback cb;
  State state{State::NotStarted};
  std::error_code err;

  PullStatus pull(std::string& chunk) {
    if (state == State::Done)   { chunk.clear(); return PullStatus::End; }
    if (state == State::Failed) { chunk.clear(); return PullStatus::Failed; }
    state = State::Streaming;

    chunk.resize(chunk_bytes);
    std::error_code ec;
    const std::size_t n = source->read(chunk.data(), chunk_bytes, ec);
    if (ec) {
      chunk.clear();
      err = ec;
      state = State::Failed;
      return PullStatus::Failed;
    }
    if (n == 0) {
      chunk.clear();
      state = State::Done;
      return PullStatus::End;
    }

    chunk.resize(n);
    read += n;
    if (cb) {
      try {
        cb(total, read, n);
      } catch (...) {
        err = std::make_error_code(std::errc::operation_canceled);
        state = State::Failed;
        chunk.clear();
        throw;
      }
    }
    return PullStatus::Chunk;
  }
};

TrackableStream::TrackableStream(std::unique_ptr<ByteSource> source, std::uint64_t total_size)
  : p_(new Impl{}) {
  p_->source = std::move(source);
  p_->total = total_size;
}

std::optional<TrackableStream> TrackableStream::from_file(const std::string& path,
                                                          std::error_code& ec) {
  const std::uint64_t size = std::filesystem::file_size(path, ec);
  if (ec) return std::nullopt;
  auto src = FileSource::open(path, ec);
  if (!src) return std::nullopt;
  return TrackableStream(std::move(src), size);
}

TrackableStream TrackableStream::from_bytes(std::string_view bytes) {
  return TrackableStream(std::make_unique<MemorySource>(bytes), bytes.size());
}

TrackableStream TrackableStream::from_buffer(std::string bytes) {
  const std::uint64_t size = bytes.size();
  return TrackableStream(std::make_unique<MemorySource>(std::move(bytes)), size);
}

TrackableStream::TrackableStream(TrackableStream&& other) noexcept : p_(other.p_) {
  other.p_ = nullptr;
}

TrackableStream& TrackableStream::operator=(TrackableStream&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

TrackableStream::~TrackableStream() { delete p_; }

TrackableStream TrackableStream::with_callback(ProgressCallback cb) && {
  set_callback(std::move(cb));
  return std::move(*this);
}

void TrackableStream::set_callback(ProgressCallback cb) { p_->cb = std::move(cb); }

void TrackableStream::set_chunk_size(std::size_t n) {
  if (n == 0) throw std::invalid_argument("chunk_size == 0");
  if (p_->state != Impl::State::NotStarted)
    throw std::logic_error("chunk_size cannot change after the first pull");
  p_->chunk_bytes = n;
}

std::size_t   TrackableStream::chunk_size() const noexcept { return p_->chunk_bytes; }
std::int64_t  TrackableStream::content_length() const noexcept { return static_cast<std::int64_t>(p_->total); }
std::uint64_t TrackableStream::total_size() const noexcept { return p_->total; }
std::uint64_t TrackableStream::bytes_read() const noexcept { return p_->read; }

SizeHint TrackableStream::size_hint() const noexcept {
  SizeHint h;
  h.lower = p_->total > p_->read ? p_->total - p_->read : 0;
  h.upper = p_->total;
  return h;
}

PullStatus TrackableStream::pull(std::string& chunk) { return p_->pull(chunk); }

bool TrackableStream::finished() const noexcept {
  return p_->state == Impl::State::Done || p_->state == Impl::State::Failed;
}

const std::error_code& TrackableStream::error() const noexcept { return p_->err; }

UploadBody TrackableStream::to_upload_body() && { return UploadBody(std::move(*this)); }

UploadBody::UploadBody(TrackableStream stream)
  : stream_(std::move(stream)), content_length_(stream_.content_length()) {}

}
