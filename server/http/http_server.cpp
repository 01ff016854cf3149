#include "server/http/http_server.h"

#include "gateway/errors.h"
#include "server/logging/logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace chatbridge {

namespace {

constexpr char kChatCompletionsPath[] = "/v1/chat/completions";
constexpr char kModelsPath[] = "/v1/models";
constexpr std::size_t kInitialBuf = 4096;
constexpr std::size_t kMaxRequest = 16 * 1024 * 1024; // 16 MB hard limit
constexpr int kClientReadTimeoutSeconds = 30;

const char *StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  }
  return "Unknown";
}

std::string CorsHeaders() {
  return "Access-Control-Allow-Origin: *\r\n"
         "Access-Control-Allow-Methods: GET,POST,PUT,PATCH,DELETE\r\n"
         "Access-Control-Allow-Headers: Content-Type,Authorization\r\n";
}

// Every non-streaming response closes the connection afterwards.
std::string BuildResponse(const std::string &body, int status = 200,
                          const std::string &content_type = "application/json") {
  std::string headers =
      "HTTP/1.1 " + std::to_string(status) + " " + StatusText(status) + "\r\n";
  if (!content_type.empty()) {
    headers += "Content-Type: " + content_type + "\r\n";
  }
  headers += CorsHeaders();
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return headers + body;
}

std::string Trim(const std::string &value) {
  auto start = value.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool ParseContentLength(const std::string &text, std::size_t *out) {
  if (text.empty() || text.size() > 12) {
    return false;
  }
  std::size_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<std::size_t>(c - '0');
  }
  *out = value;
  return true;
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace

std::string BuildErrorEnvelope(const std::string &message) {
  json envelope = {
      {"status", false},
      {"error", {{"message", message}, {"type", "invalid_request_error"}}}};
  return envelope.dump(-1, ' ', false, json::error_handler_t::replace);
}

json BuildModelList(const std::string &model_id) {
  json permission = {{"id", "modelperm-001"},
                     {"object", "model_permission"},
                     {"created", 1626777600},
                     {"allow_create_engine", true},
                     {"allow_sampling", true},
                     {"allow_logprobs", true},
                     {"allow_search_indices", false},
                     {"allow_view", true},
                     {"allow_fine_tuning", false},
                     {"organization", "*"},
                     {"group", nullptr},
                     {"is_blocking", false}};
  json model = {{"id", model_id},
                {"object", "model"},
                {"created", 1626777600},
                {"owned_by", "openai"},
                {"permission", json::array({permission})},
                {"root", model_id},
                {"parent", nullptr}};
  return {{"object", "list"}, {"data", json::array({model})}};
}

std::string HttpServer::HttpRequest::Header(const std::string &name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

HttpServer::HttpServer(std::string host, int port,
                       ChatCompletionService *service,
                       std::shared_ptr<SharedSecretAuth> auth,
                       MetricsRegistry *metrics, std::string model_id,
                       int num_workers)
    : host_(std::move(host)), port_(port), service_(service),
      auth_(std::move(auth)), metrics_(metrics), model_id_(std::move(model_id)),
      num_workers_(num_workers > 0 ? num_workers : 4) {}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  if (running_) {
    return;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    throw std::runtime_error("invalid listen address '" + host_ + "'");
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    std::string reason = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("bind " + host_ + ":" + std::to_string(port_) +
                             ": " + reason);
  }
  if (::listen(fd, 128) < 0) {
    std::string reason = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("listen: " + reason);
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }
  server_fd_.store(fd);

  running_ = true;
  force_close_ = false;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop(std::chrono::milliseconds grace) {
  if (!running_.exchange(false)) {
    return;
  }
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
  }
  queue_cv_.notify_all();

  {
    std::unique_lock<std::mutex> lock(active_mutex_);
    bool idle = idle_cv_.wait_for(lock, grace, [this] { return in_flight_ == 0; });
    if (!idle) {
      log::Warn("http", "shutdown grace elapsed, closing connections",
                "remaining=" + std::to_string(in_flight_));
      force_close_ = true;
      for (auto &[client_fd, abort] : active_sessions_) {
        ::shutdown(client_fd, SHUT_RDWR);
        abort->Trigger();
      }
    }
  }

  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = client_queue_.front();
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = client_queue_.front();
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      if (!force_close_) {
        HandleClient(session);
      }
      ReleaseSession(session.fd);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = server_fd_.load();
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break; // Socket closed by Stop() or error; exit loop.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    timeval timeout{};
    timeout.tv_sec = kClientReadTimeoutSeconds;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    ClientSession session;
    session.fd = client_fd;
    session.abort = std::make_shared<AbortSignal>();
    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      active_sessions_[client_fd] = session.abort;
      ++in_flight_;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(session);
    }
    queue_cv_.notify_one();
  }
}

void HttpServer::ReleaseSession(int fd) {
  std::lock_guard<std::mutex> lock(active_mutex_);
  if (active_sessions_.erase(fd) > 0) {
    --in_flight_;
  }
  idle_cv_.notify_all();
}

void HttpServer::HandleClient(ClientSession &session) {
  // RAII guard: decrement connections on all exit paths.
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  HttpRequest request;
  if (!ReadRequest(session, &request)) {
    return;
  }
  log::CallScope call("req-" + std::to_string(request_seq_.fetch_add(1) + 1));

  Handled handled = Dispatch(session, request);
  std::string line = request.method + " " + request.path + " " +
                     std::to_string(handled.status);
  if (handled.error.empty()) {
    log::Info("http", line);
  } else {
    log::Error("http", line, handled.error);
  }
  if (metrics_) {
    bool known = request.path == kChatCompletionsPath ||
                 request.path == kModelsPath || request.path == "/healthz" ||
                 request.path == "/metrics";
    metrics_->RecordRequest(known ? request.path : "other", handled.status);
  }
}

bool HttpServer::ReadRequest(ClientSession &session, HttpRequest *request) {
  std::string raw;
  raw.resize(kInitialBuf);
  std::size_t total = 0;
  std::size_t header_end_pos = std::string::npos;

  // Phase 1: read until we find the end-of-headers marker.
  while (header_end_pos == std::string::npos) {
    if (total >= raw.size()) {
      if (raw.size() >= kMaxRequest) {
        SendAll(session, BuildResponse(BuildErrorEnvelope("Request too large"), 413));
        return false;
      }
      raw.resize(std::min(raw.size() * 2, kMaxRequest));
    }
    ssize_t bytes = Receive(session, &raw[total], raw.size() - total);
    if (bytes <= 0) {
      return false;
    }
    total += static_cast<std::size_t>(bytes);
    header_end_pos = std::string(raw.data(), total).find("\r\n\r\n");
  }
  raw.resize(total);

  std::string head = raw.substr(0, header_end_pos);
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  auto path_end = method_end == std::string::npos
                      ? std::string::npos
                      : first_line.find(' ', method_end + 1);
  if (method_end == std::string::npos || path_end == std::string::npos) {
    SendAll(session, BuildResponse(BuildErrorEnvelope("Malformed request line"), 400));
    return false;
  }
  request->method = first_line.substr(0, method_end);
  std::string target = first_line.substr(method_end + 1, path_end - method_end - 1);
  request->path = target.substr(0, target.find('?'));

  std::size_t pos = first_line_end == std::string::npos ? head.size()
                                                        : first_line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      request->headers[ToLower(Trim(line.substr(0, colon)))] =
          Trim(line.substr(colon + 1));
    }
    pos = end + 2;
  }

  // Phase 2: read the body announced by Content-Length.
  std::size_t content_length = 0;
  std::string length_header = request->Header("content-length");
  if (!length_header.empty() &&
      !ParseContentLength(length_header, &content_length)) {
    SendAll(session, BuildResponse(BuildErrorEnvelope("Invalid Content-Length"), 400));
    return false;
  }
  if (content_length > kMaxRequest) {
    SendAll(session, BuildResponse(BuildErrorEnvelope("Request too large"), 413));
    return false;
  }

  std::size_t body_start = header_end_pos + 4;
  std::size_t needed = body_start + content_length;
  if (needed > total) {
    raw.resize(needed);
    while (total < needed) {
      ssize_t bytes = Receive(session, &raw[total], needed - total);
      if (bytes <= 0) {
        return false;
      }
      total += static_cast<std::size_t>(bytes);
    }
  }
  request->body = raw.substr(body_start, content_length);
  return true;
}

HttpServer::Handled HttpServer::Dispatch(ClientSession &session,
                                         const HttpRequest &request) {
  const std::string &method = request.method;
  const std::string &path = request.path;
  Handled handled;

  // Preflight and liveness never carry credentials.
  if (method == "OPTIONS" && (path == kChatCompletionsPath || path == kModelsPath)) {
    handled.status = 204;
    SendAll(session, BuildResponse("", 204, ""));
    return handled;
  }
  if (method == "GET" && path == "/healthz") {
    SendAll(session, BuildResponse(json({{"status", "ok"}}).dump()));
    return handled;
  }

  if (auth_ && auth_->Enabled() &&
      !auth_->IsAllowed(request.Header("authorization"))) {
    handled.status = 401;
    handled.error = "No authorization header or invalid authorization value.";
    SendAll(session, BuildResponse(BuildErrorEnvelope(handled.error), 401));
    return handled;
  }

  if (method == "POST" && path == kChatCompletionsPath) {
    return HandleChatCompletion(session, request);
  }
  if (method == "GET" && path == kModelsPath) {
    SendAll(session, BuildResponse(BuildModelList(model_id_).dump()));
    return handled;
  }
  if (method == "GET" && path == "/metrics") {
    std::string body = metrics_ ? metrics_->RenderPrometheus() : "";
    SendAll(session, BuildResponse(body, 200, "text/plain; version=0.0.4"));
    return handled;
  }

  handled.status = 404;
  handled.error = "The requested endpoint was not found.";
  SendAll(session, BuildResponse(BuildErrorEnvelope(handled.error), 404));
  return handled;
}

HttpServer::Handled
HttpServer::HandleChatCompletion(ClientSession &session,
                                 const HttpRequest &request) {
  auto started = std::chrono::steady_clock::now();
  Handled handled;
  std::unique_ptr<ResponseAssembler> assembler;
  try {
    assembler = service_->Start(request.body, session.abort.get());
  } catch (const GatewayError &ex) {
    // Business errors keep HTTP 200; only the envelope signals failure.
    handled.error = ex.what();
    if (metrics_) {
      metrics_->RecordError(ErrorKindName(ex.kind()));
    }
    SendAll(session, BuildResponse(BuildErrorEnvelope(handled.error)));
    return handled;
  } catch (const std::exception &ex) {
    handled.status = 500;
    handled.error = ex.what();
    if (metrics_) {
      metrics_->RecordError("internal");
    }
    SendAll(session, BuildResponse(BuildErrorEnvelope(handled.error), 500));
    return handled;
  }

  // Past the commit point the session's signal cancels the relay instead.
  ScopedAbortHook hook(session.abort.get());
  ResponseAssembler *call = assembler.get();
  if (session.abort && !session.abort->Arm([call] { call->Cancel(); })) {
    call->Cancel();
  }
  if (assembler->streaming()) {
    StreamCompletion(session, *assembler);
  } else {
    json document = assembler->DrainToCompletion();
    SendAll(session,
            BuildResponse(document.dump(-1, ' ', false, json::error_handler_t::replace)));
  }

  if (metrics_) {
    metrics_->RecordCompletion(assembler->streaming());
    metrics_->RecordLatency(ElapsedMs(started));
  }
  return handled;
}

void HttpServer::StreamCompletion(ClientSession &session,
                                  ResponseAssembler &assembler) {
  std::string headers = "HTTP/1.1 200 OK\r\n"
                        "Content-Type: text/event-stream\r\n"
                        "Cache-Control: no-cache\r\n"
                        "Connection: close\r\n" +
                        CorsHeaders() + "\r\n";
  bool connected = SendAll(session, headers);
  while (connected) {
    auto frame = assembler.NextFrame();
    if (!frame) {
      break;
    }
    connected = SendAll(session, *frame);
  }
  if (!connected) {
    assembler.Cancel();
    if (metrics_) {
      metrics_->RecordStreamCancellation();
    }
    log::Info("http", "client disconnected mid-stream", "id=" + assembler.identity().id);
  } else if (!assembler.saw_done()) {
    log::Warn("http", "upstream stream ended without completion",
              "id=" + assembler.identity().id);
  }
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.data();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    ssize_t sent = ::send(session.fd, data, remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (sent < 0 && errno == EINTR) {
        continue;
      }
      return false;
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace chatbridge
