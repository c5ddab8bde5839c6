#include "metrics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace server {

namespace {

constexpr const char* kMethodNames[] = {"GET", "PUT", "POST", "DELETE", "HEAD", "OTHER"};
constexpr const char* kStorageOpNames[] = {"read", "write", "rename", "delete", "list", "index", "other"};

void bump(std::atomic<std::uint64_t>& c, std::uint64_t n = 1) {
  c.fetch_add(n, std::memory_order_relaxed);
}

void header(std::ostream& os, std::string_view name, std::string_view type, std::string_view help) {
  os << "# HELP " << name << ' ' << help << '\n'
     << "# TYPE " << name << ' ' << type << '\n';
}

// One counter family with a single label over a fixed set of label values.
template <std::size_t N>
void counter_family(std::ostream& os, std::string_view name, std::string_view help,
                    std::string_view label, const char* const (&values)[N],
                    const std::array<std::atomic<std::uint64_t>, N>& counts) {
  header(os, name, "counter", help);
  for (std::size_t i = 0; i < N; ++i) {
    os << name << '{' << label << "=\"" << values[i] << "\"} " << counts[i].load() << '\n';
  }
}

} // namespace

void LatencyHistogram::observe(double latency_ms) {
  bump(count_);
  bump(sum_us_, static_cast<std::uint64_t>(std::llround(std::max(0.0, latency_ms) * 1000.0)));
  for (std::size_t i = 0; i < kBounds; ++i) {
    if (latency_ms <= kBoundsMs[i]) {
      bump(buckets_[i]);
      return;
    }
  }
}

void LatencyHistogram::render(std::ostream& os, std::string_view name, std::string_view labels) const {
  const std::string sep = labels.empty() ? "" : ",";
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBounds; ++i) {
    cumulative += buckets_[i].load();
    os << name << "_bucket{" << labels << sep << "le=\"" << kBoundsMs[i] << "\"} " << cumulative << '\n';
  }
  const std::uint64_t count = count_.load();
  os << name << "_bucket{" << labels << sep << "le=\"+Inf\"} " << count << '\n';
  const std::string braces = labels.empty() ? std::string() : "{" + std::string(labels) + "}";
  os << name << "_sum" << braces << ' ' << static_cast<double>(sum_us_.load()) / 1000.0 << '\n';
  os << name << "_count" << braces << ' ' << count << '\n';
}

std::size_t Metrics::method_slot(std::string_view method) {
  for (std::size_t i = 0; i + 1 < kMethodCount; ++i) {
    if (method == kMethodNames[i]) return i;
  }
  return kMethodCount - 1;
}

std::size_t Metrics::storage_op_slot(std::string_view op) {
  for (std::size_t i = 0; i + 1 < kStorageOpCount; ++i) {
    if (op == kStorageOpNames[i]) return i;
  }
  return kStorageOpCount - 1;
}

void Metrics::IncInFlight() {
  inflight_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::DecInFlight() {
  inflight_.fetch_sub(1, std::memory_order_relaxed);
}

void Metrics::Observe(std::string_view method,
                      unsigned status,
                      std::size_t req_bytes,
                      std::size_t resp_bytes,
                      double latency_ms) {
  const std::size_t slot = method_slot(method);
  bump(requests_[slot]);
  bump(request_bytes_[slot], req_bytes);
  bump(response_bytes_[slot], resp_bytes);
  if (status >= 400) bump(request_errors_[slot]);
  request_latency_.observe(latency_ms);
}

void Metrics::ObserveStorage(std::string_view op,
                             bool ok,
                             std::size_t bytes,
                             double latency_ms) {
  const std::size_t slot = storage_op_slot(op);
  bump(ops_[slot]);
  bump(op_bytes_[slot], bytes);
  if (!ok) bump(op_errors_[slot]);
  op_latency_[slot].observe(latency_ms);
}

std::string Metrics::RenderPrometheus() const {
  std::ostringstream os;

  counter_family(os, "s3fs_requests_total", "Total HTTP requests.", "method", kMethodNames, requests_);
  counter_family(os, "s3fs_request_errors_total", "HTTP requests answered with status >= 400.",
                 "method", kMethodNames, request_errors_);
  counter_family(os, "s3fs_request_bytes_total", "Request body bytes.", "method", kMethodNames,
                 request_bytes_);
  counter_family(os, "s3fs_response_bytes_total", "Response body bytes.", "method", kMethodNames,
                 response_bytes_);

  header(os, "s3fs_inflight_requests", "gauge", "HTTP requests being served.");
  os << "s3fs_inflight_requests " << inflight_.load() << '\n';

  header(os, "s3fs_request_latency_ms", "histogram", "Request latency in milliseconds.");
  request_latency_.render(os, "s3fs_request_latency_ms", "");

  counter_family(os, "s3fs_storage_ops_total", "Filesystem and index operations.", "op",
                 kStorageOpNames, ops_);
  counter_family(os, "s3fs_storage_errors_total", "Failed filesystem and index operations.", "op",
                 kStorageOpNames, op_errors_);
  counter_family(os, "s3fs_storage_bytes_total", "Bytes read or written by storage operations.", "op",
                 kStorageOpNames, op_bytes_);

  header(os, "s3fs_storage_latency_ms", "histogram", "Storage operation latency in milliseconds.");
  for (std::size_t i = 0; i < kStorageOpCount; ++i) {
    op_latency_[i].render(os, "s3fs_storage_latency_ms", "op=\"" + std::string(kStorageOpNames[i]) + "\"");
  }

  return os.str();
}

} // namespace server
