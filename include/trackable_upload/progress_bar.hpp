#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace tu {

// Single-line text progress bar, redrawn in place with '\r'.
class ProgressBar {
public:
  struct Config {
    std::size_t width = 40;
    std::string label = "upload";
    double min_redraw_ms = 50.0;   // throttle; finish() always draws
  };

  ProgressBar(std::uint64_t total, std::ostream& out);
  ProgressBar(std::uint64_t total, std::ostream& out, Config cfg);

  void inc(std::uint64_t n);
  void set_position(std::uint64_t pos);
  void finish();

  bool finished() const noexcept { return finished_; }
  std::uint64_t position() const noexcept { return pos_; }

  // Current line without the leading '\r'.
  std::string render_line() const;

private:
  void draw(bool force);

  std::uint64_t total_;
  std::uint64_t pos_{0};
  std::ostream& out_;
  Config cfg_;
  bool finished_{false};
  bool drawn_{false};
  std::chrono::steady_clock::time_point t0_;
  std::chrono::steady_clock::time_point last_draw_{};
};

}
