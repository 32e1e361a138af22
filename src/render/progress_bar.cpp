#include "trackable_upload/progress_bar.hpp"
#include "trackable_upload/size_parse.hpp"
#include <cstdio>
#include <sstream>
#include <utility>

namespace tu {

ProgressBar::ProgressBar(std::uint64_t total, std::ostream& out)
  : ProgressBar(total, out, Config{}) {}

ProgressBar::ProgressBar(std::uint64_t total, std::ostream& out, Config cfg)
  : total_(total), out_(out), cfg_(std::move(cfg)), t0_(std::chrono::steady_clock::now()) {}

void ProgressBar::inc(std::uint64_t n) {
  if (finished_) return;
  pos_ += n;
  draw(false);
}

void ProgressBar::set_position(std::uint64_t pos) {
  if (finished_) return;
  pos_ = pos;
  draw(false);
}

void ProgressBar::finish() {
  if (finished_) return;
  finished_ = true;
  draw(true);
  out_ << "\n";
  out_.flush();
}

std::string ProgressBar::render_line() const {
  // empty sources count as complete
  const double frac = total_ > 0
      ? (pos_ >= total_ ? 1.0 : static_cast<double>(pos_) / static_cast<double>(total_))
      : 1.0;
  const std::size_t filled = static_cast<std::size_t>(frac * cfg_.width);

  const double sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0_).count();
  const double rate = sec > 0.0 ? pos_ / sec : 0.0;

  char pct[8];
  std::snprintf(pct, sizeof(pct), "%3d%%", static_cast<int>(frac * 100.0));

  std::ostringstream o;
  o << "[" << cfg_.label << "] ["
    << std::string(filled, '#') << std::string(cfg_.width - filled, '-')
    << "] " << pct << " "
    << format_bytes(pos_) << "/" << format_bytes(total_)
    << " " << format_bytes(static_cast<std::uint64_t>(rate)) << "/s";
  return o.str();
}

void ProgressBar::draw(bool force) {
  const auto now = std::chrono::steady_clock::now();
  if (!force && drawn_) {
    const double since = std::chrono::duration<double, std::milli>(now - last_draw_).count();
    if (since < cfg_.min_redraw_ms) return;
  }
  drawn_ = true;
  last_draw_ = now;
  out_ << "\r" << render_line();
  out_.flush();
}

}
