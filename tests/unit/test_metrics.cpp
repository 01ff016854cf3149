#include <catch2/catch.hpp>

#include "server/metrics/metrics.h"

#include <string>

namespace {

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("MetricsRegistry counts requests by route and status",
          "[metrics]") {
  chatbridge::MetricsRegistry registry;
  registry.RecordRequest("/v1/chat/completions", 200);
  registry.RecordRequest("/v1/chat/completions", 200);
  registry.RecordRequest("other", 404);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "chatbridge_http_requests_total{route=\"/v1/chat/"
                           "completions\",status=\"200\"} 2"));
  REQUIRE(Contains(output,
                   "chatbridge_http_requests_total{route=\"other\",status=\"404\"} 1"));
}

TEST_CASE("MetricsRegistry counts errors by kind", "[metrics]") {
  chatbridge::MetricsRegistry registry;
  registry.RecordError("validation");
  registry.RecordError("upstream_session");
  registry.RecordError("validation");

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "chatbridge_errors_total{kind=\"validation\"} 2"));
  REQUIRE(
      Contains(output, "chatbridge_errors_total{kind=\"upstream_session\"} 1"));
}

TEST_CASE("MetricsRegistry splits completions by mode", "[metrics]") {
  chatbridge::MetricsRegistry registry;
  registry.RecordCompletion(true);
  registry.RecordCompletion(false);
  registry.RecordCompletion(false);
  registry.RecordStreamCancellation();

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "chatbridge_completions_total{mode=\"stream\"} 1"));
  REQUIRE(Contains(output, "chatbridge_completions_total{mode=\"buffered\"} 2"));
  REQUIRE(Contains(output, "chatbridge_stream_cancellations_total 1"));
  REQUIRE(registry.StreamCancellations() == 1);
}

TEST_CASE("MetricsRegistry separates solved and fallback proof tokens",
          "[metrics]") {
  chatbridge::MetricsRegistry registry;
  registry.RecordProofOfWork(false, 12, 3.0);
  registry.RecordProofOfWork(true, 100000, 900.0);

  REQUIRE(registry.ProofOfWorkSolved() == 1);
  REQUIRE(registry.ProofOfWorkDegraded() == 1);
  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "chatbridge_pow_tokens_total{result=\"solved\"} 1"));
  REQUIRE(
      Contains(output, "chatbridge_pow_tokens_total{result=\"degraded\"} 1"));
  REQUIRE(Contains(output, "chatbridge_pow_iterations_total 100012"));
  REQUIRE(Contains(output, "chatbridge_pow_duration_ms_count 2"));
}

TEST_CASE("MetricsRegistry latency histogram is cumulative", "[metrics]") {
  chatbridge::MetricsRegistry registry;
  registry.RecordLatency(80.0);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "chatbridge_request_duration_ms_bucket{le=\"50\"} 0"));
  REQUIRE(
      Contains(output, "chatbridge_request_duration_ms_bucket{le=\"100\"} 1"));
  REQUIRE(
      Contains(output, "chatbridge_request_duration_ms_bucket{le=\"+Inf\"} 1"));
  REQUIRE(Contains(output, "chatbridge_request_duration_ms_sum 80"));
  REQUIRE(Contains(output, "chatbridge_request_duration_ms_count 1"));
}

TEST_CASE("MetricsRegistry tracks active connections", "[metrics]") {
  chatbridge::MetricsRegistry registry;
  registry.IncrementConnections();
  registry.IncrementConnections();
  registry.DecrementConnections();
  REQUIRE(registry.ActiveConnections() == 1);
  REQUIRE(Contains(registry.RenderPrometheus(),
                   "chatbridge_active_connections 1"));
}
