#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace server {

// Cumulative latency histogram with fixed millisecond bounds.
class LatencyHistogram {
public:
  static constexpr std::size_t kBounds = 13;
  static constexpr std::array<double, kBounds> kBoundsMs = {1, 2, 5, 10, 25, 50, 100, 250, 500,
                                                            1000, 2500, 5000, 10000};

  void observe(double latency_ms);

  // Emits <name>_bucket/_sum/_count samples; `labels` is empty or `k="v"`.
  void render(std::ostream& os, std::string_view name, std::string_view labels) const;

private:
  std::array<std::atomic<std::uint64_t>, kBounds> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

// Process-wide counters rendered in the Prometheus text format at /metrics.
class Metrics {
public:
  Metrics() = default;

  void IncInFlight();
  void DecInFlight();

  void Observe(std::string_view method,
               unsigned status,
               std::size_t req_bytes,
               std::size_t resp_bytes,
               double latency_ms);

  // op: read, write, rename, delete, list or index.
  void ObserveStorage(std::string_view op,
                      bool ok,
                      std::size_t bytes,
                      double latency_ms);

  std::string RenderPrometheus() const;

private:
  static constexpr std::size_t kMethodCount = 6;   // GET PUT POST DELETE HEAD OTHER
  static constexpr std::size_t kStorageOpCount = 7; // see storage_op_names

  using Counters = std::array<std::atomic<std::uint64_t>, kMethodCount>;
  using OpCounters = std::array<std::atomic<std::uint64_t>, kStorageOpCount>;

  static std::size_t method_slot(std::string_view method);
  static std::size_t storage_op_slot(std::string_view op);

  Counters requests_{};
  Counters request_errors_{};
  Counters request_bytes_{};
  Counters response_bytes_{};
  std::atomic<std::int64_t> inflight_{0};
  LatencyHistogram request_latency_;

  OpCounters ops_{};
  OpCounters op_errors_{};
  OpCounters op_bytes_{};
  std::array<LatencyHistogram, kStorageOpCount> op_latency_;
};

} // namespace server
