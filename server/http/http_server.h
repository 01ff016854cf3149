#pragma once

#include "gateway/chat_completion_service.h"
#include "net/abort_signal.h"
#include "server/auth/shared_secret_auth.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include <sys/types.h>

namespace chatbridge {

// `{"status":false,"error":{"message":...,"type":"invalid_request_error"}}`
std::string BuildErrorEnvelope(const std::string &message);

// Static /v1/models document advertising `model_id`.
nlohmann::json BuildModelList(const std::string &model_id);

class HttpServer {
 public:
  HttpServer(std::string host,
             int port,
             ChatCompletionService *service,
             std::shared_ptr<SharedSecretAuth> auth,
             MetricsRegistry *metrics,
             std::string model_id,
             int num_workers = 4);
  ~HttpServer();

  // Binds the listener and starts the accept thread and workers. Throws
  // std::runtime_error when the address cannot be bound.
  void Start();
  // Stops accepting, lets in-flight requests run for up to `grace`, then
  // force-closes what is left and joins every thread.
  void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(0));

  // Bound port; differs from the requested one when that was 0.
  int port() const { return port_; }

 private:
  struct ClientSession {
    int fd{-1};
    // Fired by Stop() once the grace period is over.
    std::shared_ptr<AbortSignal> abort;
  };

  struct HttpRequest {
    std::string method;
    std::string path;
    // Lowercased names.
    std::map<std::string, std::string> headers;
    std::string body;

    std::string Header(const std::string &name) const;
  };

  // Outcome of one request, for the access log.
  struct Handled {
    int status{200};
    std::string error;
  };

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession &session);
  // False when the connection should be closed without further handling.
  bool ReadRequest(ClientSession &session, HttpRequest *request);
  Handled Dispatch(ClientSession &session, const HttpRequest &request);
  Handled HandleChatCompletion(ClientSession &session, const HttpRequest &request);
  void StreamCompletion(ClientSession &session, ResponseAssembler &assembler);

  void ReleaseSession(int fd);

  bool SendAll(ClientSession &session, const std::string &payload);
  ssize_t Receive(ClientSession &session, char *buffer, std::size_t length);
  void CloseSession(ClientSession &session);

  std::string host_;
  int port_;
  ChatCompletionService *service_;
  std::shared_ptr<SharedSecretAuth> auth_;
  MetricsRegistry *metrics_;
  std::string model_id_;
  int num_workers_;

  std::atomic<bool> running_{false};
  std::atomic<bool> force_close_{false};
  std::atomic<int> server_fd_{-1};
  // Tags the log lines of each request.
  std::atomic<std::uint64_t> request_seq_{0};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  // Sessions accepted but not yet closed, keyed by fd.
  std::mutex active_mutex_;
  std::condition_variable idle_cv_;
  std::unordered_map<int, std::shared_ptr<AbortSignal>> active_sessions_;
  int in_flight_{0};
};

}  // namespace chatbridge
