#include "gateway/chat_completion_service.h"
#include "gateway/proof_of_work.h"
#include "gateway/upstream_backend.h"
#include "net/http_client.h"
#include "server/auth/shared_secret_auth.h"
#include "server/config/server_config.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

const char *Mark(bool set) { return set ? " (set)" : ""; }

void PrintBanner(const chatbridge::ServerConfig &config) {
  std::cout << "Access the API server at: http://" << config.host << ":" << config.port
            << "/v1/chat/completions\n\n"
            << "Environment Variables:\n"
            << "  - PORT: change the listening port, defaulting to 3040"
            << Mark(config.port_from_env) << "\n"
            << "  - ALL_PROXY: configure the proxy server, supporting HTTP, HTTPS, and SOCKS5 "
               "protocols"
            << Mark(config.proxy_from_env) << "\n"
            << "  - AUTHORIZATION: only for internal use to protect the API and will not be "
               "sent upstream"
            << Mark(config.authorization_from_env) << "\n"
            << std::endl;
}

}  // namespace

int main(int argc, char **argv) {
  std::string config_path = "config/server.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    }
  }

  chatbridge::ServerConfig config;
  try {
    config = chatbridge::LoadServerConfig(config_path);
  } catch (const chatbridge::ConfigError &ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }

  chatbridge::log::SetJsonMode(config.log_json);
  chatbridge::log::SetMinLevel(chatbridge::log::ParseLevel(config.log_level));

  chatbridge::HttpClientOptions client_options;
  client_options.connect_timeout_seconds = config.connect_timeout_seconds;
  client_options.read_timeout_seconds = config.read_timeout_seconds;
  if (!config.proxy_url.empty()) {
    client_options.proxy = chatbridge::ParseProxyUrl(config.proxy_url);
  }
  chatbridge::HttpClient client(client_options);

  chatbridge::ChatGptBackendOptions backend_options;
  backend_options.base_url = config.upstream_base_url;
  backend_options.user_agent = config.user_agent;
  chatbridge::ChatGptBackend backend(&client, backend_options);

  // Drawn once; every proof-of-work payload of this process carries it.
  chatbridge::ProofOfWorkConfig pow_config;
  pow_config.process_constant = chatbridge::DrawProcessConstant();
  pow_config.max_iterations = config.pow_max_iterations;
  pow_config.user_agent = config.user_agent;
  chatbridge::ProofOfWorkSolver solver(pow_config);

  auto &metrics = chatbridge::GlobalMetrics();
  chatbridge::ChatCompletionOptions service_options;
  service_options.merge_policy = config.merge_policy;
  service_options.upstream_model = config.upstream_model;
  service_options.public_model = config.model_id;
  chatbridge::ChatCompletionService service(&backend, &solver, service_options, &metrics);

  auto auth = std::make_shared<chatbridge::SharedSecretAuth>(config.authorization);

  chatbridge::HttpServer server(config.host, config.port, &service, auth, &metrics,
                                config.model_id, config.http_workers);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  try {
    server.Start();
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
  chatbridge::log::Info("server", "listening",
                        "host=" + config.host + " port=" + std::to_string(server.port()) +
                            " merge_policy=" + chatbridge::MergePolicyName(config.merge_policy) +
                            " proxy=" + (config.proxy_url.empty() ? "none" : "on"));
  PrintBanner(config);

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  chatbridge::log::Info("server", "shutting down");
  server.Stop(std::chrono::seconds(config.shutdown_grace_seconds));
  return 0;
}
