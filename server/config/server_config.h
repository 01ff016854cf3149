#pragma once

#include "gateway/chat_request.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace YAML {
class Node;
}

namespace chatbridge {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ServerConfig {
  // server
  std::string host{"0.0.0.0"};
  int port{3040};
  int http_workers{8};
  int shutdown_grace_seconds{10};

  // auth
  std::string authorization;

  // network
  std::string proxy_url;
  int connect_timeout_seconds{10};
  int read_timeout_seconds{300};

  // upstream
  std::string upstream_base_url{"https://chat.openai.com/backend-anon"};
  std::string upstream_model{"text-davinci-002-render-sha"};
  MergePolicy merge_policy{MergePolicy::kInstructionMerge};
  std::string user_agent;

  // proof_of_work
  int pow_max_iterations{100000};

  // api
  std::string model_id{"gpt-3.5-turbo"};

  // logging
  std::string log_level{"info"};
  bool log_json{false};

  // Set when the matching environment variable overrode the file.
  bool port_from_env{false};
  bool proxy_from_env{false};
  bool authorization_from_env{false};
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> ProcessEnv(const std::string &name);

// Applies the keys present in `root` on top of `config`. Throws ConfigError.
void ApplyYaml(const YAML::Node &root, ServerConfig *config);

// PORT, ALL_PROXY, AUTHORIZATION and the CHATBRIDGE_ *overrides.
// Throws ConfigError naming the offending variable.
void ApplyEnvironment(const EnvLookup &env, ServerConfig *config);

// Defaults, then `path` when it exists, then the environment.
ServerConfig LoadServerConfig(const std::string &path, const EnvLookup &env = ProcessEnv);

}  // namespace chatbridge
