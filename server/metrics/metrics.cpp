#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace chatbridge {

namespace {
MetricsRegistry g_metrics;

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &h) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << h.counts[i].load()
        << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << h.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << h.sum_ms.load() << "\n";
  out << name << "_count " << h.total.load() << "\n";
}
} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRequest(const std::string &route, int status) {
  std::lock_guard<std::mutex> lock(labels_mutex_);
  ++requests_[{route, status}];
}

void MetricsRegistry::RecordError(const std::string &kind) {
  std::lock_guard<std::mutex> lock(labels_mutex_);
  ++errors_[kind];
}

void MetricsRegistry::RecordCompletion(bool stream) {
  if (stream) {
    stream_completions_.fetch_add(1, std::memory_order_relaxed);
  } else {
    buffered_completions_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordStreamCancellation() {
  stream_cancellations_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRelayOutcome(const std::string &outcome) {
  std::lock_guard<std::mutex> lock(labels_mutex_);
  ++relay_outcomes_[outcome];
}

void MetricsRegistry::RecordProofOfWork(bool degraded, int iterations,
                                        double solve_ms) {
  if (degraded) {
    pow_degraded_.fetch_add(1, std::memory_order_relaxed);
  } else {
    pow_solved_.fetch_add(1, std::memory_order_relaxed);
  }
  pow_iterations_.fetch_add(static_cast<uint64_t>(std::max(0, iterations)),
                            std::memory_order_relaxed);
  pow_latency_.Record(solve_ms);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::RecordFirstEventLatency(double ms) {
  first_event_latency_.Record(ms);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::map<std::pair<std::string, int>, uint64_t> requests;
  std::map<std::string, uint64_t> errors;
  std::map<std::string, uint64_t> outcomes;
  {
    std::lock_guard<std::mutex> lock(labels_mutex_);
    requests = requests_;
    errors = errors_;
    outcomes = relay_outcomes_;
  }
  std::ostringstream out;

  // --- Counters ---
  out << "# HELP chatbridge_http_requests_total HTTP requests by route and status\n";
  out << "# TYPE chatbridge_http_requests_total counter\n";
  for (const auto &[key, count] : requests) {
    out << "chatbridge_http_requests_total{route=\"" << key.first
        << "\",status=\"" << key.second << "\"} " << count << "\n";
  }

  out << "# HELP chatbridge_errors_total Chat completion errors by kind\n";
  out << "# TYPE chatbridge_errors_total counter\n";
  for (const auto &[kind, count] : errors) {
    out << "chatbridge_errors_total{kind=\"" << kind << "\"} " << count << "\n";
  }

  out << "# HELP chatbridge_completions_total Committed chat completions by mode\n";
  out << "# TYPE chatbridge_completions_total counter\n";
  out << "chatbridge_completions_total{mode=\"stream\"} "
      << stream_completions_.load() << "\n";
  out << "chatbridge_completions_total{mode=\"buffered\"} "
      << buffered_completions_.load() << "\n";

  out << "# HELP chatbridge_stream_cancellations_total Streams abandoned by the client\n";
  out << "# TYPE chatbridge_stream_cancellations_total counter\n";
  out << "chatbridge_stream_cancellations_total " << stream_cancellations_.load()
      << "\n";

  out << "# HELP chatbridge_relay_outcomes_total Upstream relay terminations by outcome\n";
  out << "# TYPE chatbridge_relay_outcomes_total counter\n";
  for (const auto &[outcome, count] : outcomes) {
    out << "chatbridge_relay_outcomes_total{outcome=\"" << outcome << "\"} "
        << count << "\n";
  }

  out << "# HELP chatbridge_pow_tokens_total Proof-of-work tokens by result\n";
  out << "# TYPE chatbridge_pow_tokens_total counter\n";
  out << "chatbridge_pow_tokens_total{result=\"solved\"} " << pow_solved_.load()
      << "\n";
  out << "chatbridge_pow_tokens_total{result=\"degraded\"} "
      << pow_degraded_.load() << "\n";

  out << "# HELP chatbridge_pow_iterations_total Hash evaluations spent on proof-of-work\n";
  out << "# TYPE chatbridge_pow_iterations_total counter\n";
  out << "chatbridge_pow_iterations_total " << pow_iterations_.load() << "\n";

  // --- Histograms ---
  RenderHistogram(out, "chatbridge_request_duration_ms",
                  "End-to-end chat completion latency", request_latency_);
  RenderHistogram(out, "chatbridge_first_event_duration_ms",
                  "Call start to first upstream event", first_event_latency_);
  RenderHistogram(out, "chatbridge_pow_duration_ms",
                  "Proof-of-work solve time", pow_latency_);

  // --- Gauges ---
  out << "# HELP chatbridge_active_connections Client connections being served\n";
  out << "# TYPE chatbridge_active_connections gauge\n";
  out << "chatbridge_active_connections " << active_connections_.load() << "\n";

  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace chatbridge
