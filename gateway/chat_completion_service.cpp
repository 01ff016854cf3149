#include "gateway/chat_completion_service.h"

#include "gateway/errors.h"
#include "gateway/random_ids.h"
#include "gateway/session_negotiator.h"
#include "gateway/upstream_relay.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <chrono>
#include <utility>

namespace chatbridge {
namespace {

constexpr char kCancelledMessage[] = "request cancelled";

void ThrowIfAborted(const AbortSignal *abort) {
  if (abort && abort->triggered()) {
    throw UpstreamTransportError(kCancelledMessage);
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace

ChatCompletionService::ChatCompletionService(UpstreamBackend *backend,
                                             const ProofOfWorkSolver *solver,
                                             ChatCompletionOptions options,
                                             MetricsRegistry *metrics)
    : backend_(backend), solver_(solver), options_(std::move(options)),
      metrics_(metrics) {}

std::unique_ptr<ResponseAssembler>
ChatCompletionService::Start(const std::string &body, AbortSignal *abort) {
  auto started = std::chrono::steady_clock::now();

  ChatRequest request = ParseChatRequest(body);
  auto messages = TranslateMessages(request, options_.merge_policy);
  std::string conversation =
      BuildConversationBody(messages, options_.upstream_model).dump();

  ThrowIfAborted(abort);
  SessionRequirements requirements =
      SessionNegotiator(backend_, abort).Negotiate();

  auto solve_started = std::chrono::steady_clock::now();
  ProofToken proof = solver_->Solve(requirements.challenge_seed,
                                    requirements.challenge_difficulty);
  double solve_ms = ElapsedMs(solve_started);
  if (metrics_) {
    metrics_->RecordProofOfWork(proof.degraded, proof.iterations, solve_ms);
  }
  log::Debug("pow", proof.degraded ? "fallback token" : "solved",
             "iterations=" + std::to_string(proof.iterations) +
                 " ms=" + std::to_string(static_cast<long>(solve_ms)));
  ThrowIfAborted(abort);

  ConversationCredentials credentials;
  credentials.device_id = requirements.device_id;
  credentials.session_token = requirements.session_token;
  credentials.proof_token = proof.value;

  CompletionIdentity identity;
  identity.id = NewCompletionId();
  identity.created = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
  identity.model = options_.public_model;

  auto relay = std::make_unique<UpstreamRelay>(
      backend_->OpenConversation(credentials, conversation), metrics_);
  relay->Start();
  auto assembler =
      std::make_unique<ResponseAssembler>(std::move(relay), std::move(identity));

  // Declared after the assembler so it is disarmed before the relay dies.
  ScopedAbortHook hook(abort);
  ResponseAssembler *pending = assembler.get();
  if (abort && !abort->Arm([pending] { pending->Cancel(); })) {
    assembler->Cancel();
    throw UpstreamTransportError(kCancelledMessage);
  }
  assembler->AwaitCommit(request.stream);
  if (metrics_) {
    metrics_->RecordFirstEventLatency(ElapsedMs(started));
  }
  return assembler;
}

} // namespace chatbridge
