#include "trackable_upload/byte_source.hpp"
#include "trackable_upload/trackable_stream.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static int fails = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { ++fails; std::cerr << "[FAIL] " << what << "\n"; }
}

static fs::path write_temp(const std::string& name, const std::string& bytes) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream out(p, std::ios::binary);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return p;
}

int main() {
  std::string data(5000, '\0');
  for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<char>(i % 251);
  const fs::path f = write_temp("tu_test_byte_source.bin", data);

  // FileSource reads the whole file then reports end
  {
    std::error_code ec;
    auto src = tu::FileSource::open(f.string(), ec);
    check(src != nullptr && !ec, "FileSource::open existing file");
    if (src) {
      std::vector<char> buf(1500);
      std::string got;
      std::size_t n;
      while ((n = src->read(buf.data(), buf.size(), ec)) > 0) got.append(buf.data(), n);
      check(!ec, "FileSource: no error at EOF");
      check(got == data, "FileSource: bytes match");
    }
  }

  // FileSource::open on a missing path
  {
    std::error_code ec;
    auto src = tu::FileSource::open((fs::temp_directory_path() / "tu_no_such_file.bin").string(), ec);
    check(src == nullptr, "FileSource::open missing -> null");
    check(ec == std::errc::no_such_file_or_directory, "FileSource::open missing -> ENOENT");
  }

  // from_file: size from metadata, bytes in order
  {
    std::error_code ec;
    auto s = tu::TrackableStream::from_file(f.string(), ec);
    check(s.has_value() && !ec, "from_file existing");
    if (s) {
      check(s->content_length() == 5000, "from_file: content_length from stat");
      std::uint64_t last = 0;
      int calls = 0;
      s->set_callback([&](std::uint64_t total, std::uint64_t sent, std::uint64_t){
        ++calls; last = sent; check(total == 5000, "from_file: callback total");
      });
      std::string c, joined;
      while (s->pull(c) == tu::PullStatus::Chunk) joined += c;
      check(joined == data, "from_file: concatenation");
      check(calls == 3 && last == 5000, "from_file: 3 callbacks ending at 5000");
    }
  }

  // from_file: construction errors never produce a stream
  {
    std::error_code ec;
    auto s = tu::TrackableStream::from_file("/definitely/not/here.bin", ec);
    check(!s.has_value(), "from_file missing -> nullopt");
    check(static_cast<bool>(ec), "from_file missing -> error code set");

    ec.clear();
    auto d = tu::TrackableStream::from_file(fs::temp_directory_path().string(), ec);
    check(!d.has_value() && static_cast<bool>(ec), "from_file directory -> error");
  }

  // empty file
  {
    const fs::path e = write_temp("tu_test_empty.bin", "");
    std::error_code ec;
    auto s = tu::TrackableStream::from_file(e.string(), ec);
    check(s.has_value(), "from_file empty file");
    if (s) {
      std::string c;
      check(s->content_length() == 0, "empty file: content_length 0");
      check(s->pull(c) == tu::PullStatus::End, "empty file: immediate End");
    }
    fs::remove(e);
  }

  // MemorySource: borrowed and owned views
  {
    std::error_code ec;
    tu::MemorySource borrowed{std::string_view(data)};
    tu::MemorySource owned{std::string("abc")};
    char buf[4] = {};
    check(borrowed.size() == 5000, "MemorySource borrowed size");
    check(owned.read(buf, sizeof(buf), ec) == 3 && std::string(buf, 3) == "abc", "MemorySource owned read");
    check(owned.read(buf, sizeof(buf), ec) == 0, "MemorySource owned end");
  }

  fs::remove(f);
  if (fails) { std::cerr << "[FAIL] byte_source: " << fails << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] byte_source\n";
  return 0;
}
