#include "server/config/server_config.h"

#include "gateway/proof_of_work.h"
#include "net/http_client.h"
#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace chatbridge {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

// Strict decimal parse; no sign, no trailing garbage.
std::optional<long> ParseNumber(const std::string &text) {
  if (text.empty() || text.size() > 9) {
    return std::nullopt;
  }
  long value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

template <typename T>
void Read(const YAML::Node &section, const char *key, T *out) {
  if (section && section[key]) {
    *out = section[key].as<T>();
  }
}

void RequirePositive(int value, const std::string &key) {
  if (value <= 0) {
    throw ConfigError(key + " must be positive");
  }
}

void ValidateProxy(const std::string &url, const std::string &source) {
  if (url.empty()) {
    return;
  }
  try {
    ParseProxyUrl(url);
  } catch (const std::invalid_argument &ex) {
    throw ConfigError(source + ", " + ex.what());
  }
}

}  // namespace

std::optional<std::string> ProcessEnv(const std::string &name) {
  if (const char *value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

void ApplyYaml(const YAML::Node &root, ServerConfig *config) {
  try {
    const YAML::Node server = root["server"];
    Read(server, "host", &config->host);
    Read(server, "port", &config->port);
    Read(server, "http_workers", &config->http_workers);
    Read(server, "shutdown_grace_seconds", &config->shutdown_grace_seconds);

    Read(root["auth"], "authorization", &config->authorization);

    const YAML::Node network = root["network"];
    Read(network, "proxy", &config->proxy_url);
    Read(network, "connect_timeout_seconds", &config->connect_timeout_seconds);
    Read(network, "read_timeout_seconds", &config->read_timeout_seconds);

    const YAML::Node upstream = root["upstream"];
    Read(upstream, "base_url", &config->upstream_base_url);
    Read(upstream, "model", &config->upstream_model);
    Read(upstream, "user_agent", &config->user_agent);
    if (upstream && upstream["merge_policy"]) {
      config->merge_policy = ParseMergePolicy(upstream["merge_policy"].as<std::string>());
    }

    Read(root["proof_of_work"], "max_iterations", &config->pow_max_iterations);
    Read(root["api"], "model_id", &config->model_id);

    const YAML::Node logging = root["logging"];
    Read(logging, "level", &config->log_level);
    if (logging && logging["format"]) {
      config->log_json = ToLower(logging["format"].as<std::string>()) == "json";
    }
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("invalid config: ") + ex.what());
  } catch (const std::invalid_argument &ex) {
    throw ConfigError(std::string("invalid config: ") + ex.what());
  }

  if (config->port <= 0 || config->port > 65535) {
    throw ConfigError("server.port must be in 1..65535");
  }
  RequirePositive(config->http_workers, "server.http_workers");
  RequirePositive(config->connect_timeout_seconds, "network.connect_timeout_seconds");
  RequirePositive(config->read_timeout_seconds, "network.read_timeout_seconds");
  if (config->shutdown_grace_seconds < 0) {
    throw ConfigError("server.shutdown_grace_seconds must be >= 0");
  }
  if (config->pow_max_iterations < 0) {
    throw ConfigError("proof_of_work.max_iterations must be >= 0");
  }
  ValidateProxy(config->proxy_url, "invalid network.proxy");
}

void ApplyEnvironment(const EnvLookup &env, ServerConfig *config) {
  if (auto port = env("PORT")) {
    auto parsed = ParseNumber(*port);
    if (!parsed || *parsed <= 0 || *parsed > 65535) {
      throw ConfigError("Invalid environment variable $PORT");
    }
    config->port = static_cast<int>(*parsed);
    config->port_from_env = true;
  }
  if (auto proxy = env("ALL_PROXY")) {
    ValidateProxy(*proxy, "Invalid environment variable $ALL_PROXY");
    config->proxy_url = *proxy;
    config->proxy_from_env = true;
  }
  if (auto authorization = env("AUTHORIZATION")) {
    if (!authorization->empty()) {
      config->authorization = *authorization;
      config->authorization_from_env = true;
    }
  }
  if (auto workers = env("CHATBRIDGE_HTTP_WORKERS")) {
    auto parsed = ParseNumber(*workers);
    if (!parsed || *parsed <= 0) {
      throw ConfigError("Invalid environment variable $CHATBRIDGE_HTTP_WORKERS");
    }
    config->http_workers = static_cast<int>(*parsed);
  }
  if (auto level = env("CHATBRIDGE_LOG_LEVEL")) {
    config->log_level = *level;
  }
  if (auto format = env("CHATBRIDGE_LOG_FORMAT")) {
    config->log_json = ToLower(*format) == "json";
  }
  try {
    log::ParseLevel(config->log_level);
  } catch (const std::invalid_argument &ex) {
    throw ConfigError(ex.what());
  }
}

ServerConfig LoadServerConfig(const std::string &path, const EnvLookup &env) {
  ServerConfig config;
  config.user_agent = kBrowserUserAgent;
  if (!path.empty() && std::filesystem::exists(path)) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path);
    } catch (const YAML::Exception &ex) {
      throw ConfigError("failed to load " + path + ": " + ex.what());
    }
    ApplyYaml(root, &config);
  }
  ApplyEnvironment(env, &config);
  return config;
}

}  // namespace chatbridge
