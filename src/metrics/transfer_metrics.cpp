#include "trackable_upload/metrics.hpp"

namespace tu {

void TransferMetrics::reset() {
  total_ = bytes_ = chunks_ = 0;
  started_ = false;
  series_.clear();
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void TransferMetrics::start(std::uint64_t total) {
  total_ = total;
  bytes_ = chunks_ = 0;
  series_.clear();
  started_ = true;
  t0_ = last_ = clock::now();
}

double TransferMetrics::ms_since_start(clock::time_point t) const {
  return std::chrono::duration<double, std::milli>(t - t0_).count();
}

void TransferMetrics::on_chunk(std::uint64_t sent, std::uint64_t /*chunk*/) {
  if (!started_) start(0);
  bytes_ = sent;
  ++chunks_;

  const auto now = clock::now();
  const double t_ms = ms_since_start(now);
  const bool due = series_.empty()
      || (t_ms - series_.back().time_ms) >= sample_every_ms_
      || (total_ > 0 && sent >= total_);
  last_ = now;
  if (!due) return;

  ThroughputSample s;
  s.time_ms = t_ms;
  s.bytes = sent;
  s.mb_s = t_ms > 0.0 ? (sent / (1024.0 * 1024.0)) / (t_ms / 1000.0) : 0.0;
  series_.push_back(s);
}

void TransferMetrics::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) {
    stage_order_.push_back(key);
    stage_accum_ms_[key] = 0;
  }
  stage_starts_[key] = clock::now();
}

void TransferMetrics::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

TransferStats TransferMetrics::snapshot() const {
  TransferStats r;
  r.total = total_;
  r.bytes = bytes_;
  r.chunks = chunks_;
  r.wall_ms = started_ ? ms_since_start(last_) : 0.0;
  r.throughput_mb_s = (r.wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (r.wall_ms / 1000.0) : 0.0;
  r.avg_chunk_bytes = chunks_ ? static_cast<double>(bytes_) / chunks_ : 0.0;

  r.series = series_;
  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it->second});
  }
  return r;
}

}
