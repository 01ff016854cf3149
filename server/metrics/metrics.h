#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace chatbridge {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000,
  // 10000, 30000, +Inf
  static constexpr std::array<double, 10> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0};
  std::array<std::atomic<uint64_t>, 11> counts{}; // 10 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  // One finished HTTP exchange, labelled by route and status code.
  void RecordRequest(const std::string &route, int status);
  // Business error surfaced through the error envelope ("validation",
  // "upstream_session", "upstream_transport").
  void RecordError(const std::string &kind);
  void RecordCompletion(bool stream);
  // Client went away while a stream was being relayed.
  void RecordStreamCancellation();
  void RecordRelayOutcome(const std::string &outcome);

  // Proof-of-work: solved and fallback tokens are counted separately.
  void RecordProofOfWork(bool degraded, int iterations, double solve_ms);

  void RecordLatency(double request_ms);
  // Call start to the upstream's first event (the commit point).
  void RecordFirstEventLatency(double ms);

  void IncrementConnections();
  void DecrementConnections();
  int ActiveConnections() const { return active_connections_.load(); }

  uint64_t ProofOfWorkSolved() const { return pow_solved_.load(); }
  uint64_t ProofOfWorkDegraded() const { return pow_degraded_.load(); }
  uint64_t StreamCancellations() const { return stream_cancellations_.load(); }

  std::string RenderPrometheus() const;

private:
  mutable std::mutex labels_mutex_;
  std::map<std::pair<std::string, int>, uint64_t> requests_;
  std::map<std::string, uint64_t> errors_;
  std::map<std::string, uint64_t> relay_outcomes_;

  std::atomic<uint64_t> stream_completions_{0};
  std::atomic<uint64_t> buffered_completions_{0};
  std::atomic<uint64_t> stream_cancellations_{0};
  std::atomic<uint64_t> pow_solved_{0};
  std::atomic<uint64_t> pow_degraded_{0};
  std::atomic<uint64_t> pow_iterations_{0};

  LatencyHistogram request_latency_;
  LatencyHistogram first_event_latency_;
  LatencyHistogram pow_latency_;

  std::atomic<int> active_connections_{0};
};

MetricsRegistry &GlobalMetrics();

} // namespace chatbridge
