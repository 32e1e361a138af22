#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tu {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct ThroughputSample {
  double time_ms = 0.0;
  std::uint64_t bytes = 0;
  double mb_s = 0.0;
};

struct TransferStats {
  std::uint64_t total = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double avg_chunk_bytes = 0.0;

  std::vector<StageTiming> stages;
  std::vector<ThroughputSample> series;
};

// Collects per-chunk progress; on_chunk has the shape of a progress callback.
class TransferMetrics {
public:
  explicit TransferMetrics(double sample_every_ms = 100.0) : sample_every_ms_(sample_every_ms) {}

  void reset();
  void start(std::uint64_t total);
  void on_chunk(std::uint64_t sent, std::uint64_t chunk);

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  TransferStats snapshot() const;

private:
  using clock = std::chrono::steady_clock;
  double ms_since_start(clock::time_point t) const;

  double sample_every_ms_;
  std::uint64_t total_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chunks_{0};
  bool started_{false};
  clock::time_point t0_{};
  clock::time_point last_{};
  std::vector<ThroughputSample> series_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, clock::time_point> stage_starts_;
};

}
