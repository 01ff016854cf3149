#pragma once

#include "gateway/chat_request.h"
#include "gateway/proof_of_work.h"
#include "gateway/response_assembler.h"
#include "gateway/upstream_backend.h"
#include "net/abort_signal.h"

#include <memory>
#include <string>

namespace chatbridge {

class MetricsRegistry;

struct ChatCompletionOptions {
  MergePolicy merge_policy{MergePolicy::kInstructionMerge};
  // Model slug sent upstream.
  std::string upstream_model{"text-davinci-002-render-sha"};
  // Model id reported to clients.
  std::string public_model{"gpt-3.5-turbo"};
};

// Runs one chat-completion call up to its commit point.
//
// Start() validates and translates the body (no network on failure),
// negotiates a session, solves the proof of work, opens the upstream stream
// on its own relay thread and waits for the first relay event. Any failure
// before that point is thrown as a GatewayError. The returned assembler owns
// the relay; render the response from it and drop it when done.
//
// `abort` may fire from another thread while Start() blocks; the pending
// upstream request or relay is torn down and Start() throws. The signal is
// disarmed again before Start() returns.
class ChatCompletionService {
public:
  ChatCompletionService(UpstreamBackend *backend,
                        const ProofOfWorkSolver *solver,
                        ChatCompletionOptions options,
                        MetricsRegistry *metrics = nullptr);

  std::unique_ptr<ResponseAssembler> Start(const std::string &body,
                                           AbortSignal *abort = nullptr);

  const ChatCompletionOptions &options() const { return options_; }

private:
  UpstreamBackend *backend_;
  const ProofOfWorkSolver *solver_;
  ChatCompletionOptions options_;
  MetricsRegistry *metrics_;
};

} // namespace chatbridge
