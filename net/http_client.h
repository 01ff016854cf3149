#pragma once

#include "net/abort_signal.h"

#include <map>
#include <string>

#include <sys/types.h>

#include <openssl/ssl.h>

namespace chatbridge {

struct ProxyConfig {
  enum class Kind { kNone, kHttp, kHttps, kSocks5 };

  Kind kind{Kind::kNone};
  std::string host;
  int port{0};
  std::string username;
  std::string password;
  // socks5h:// resolves the target host on the proxy side.
  bool remote_dns{false};

  bool enabled() const { return kind != Kind::kNone; }
};

// Parses http://, https://, socks5:// and socks5h:// proxy URLs with optional
// user:password@ credentials. Throws std::invalid_argument on anything else.
ProxyConfig ParseProxyUrl(const std::string &url);

struct HttpClientOptions {
  int connect_timeout_seconds{10};
  int read_timeout_seconds{60};
  ProxyConfig proxy;
};

// Header names are stored lowercased.
using HeaderMap = std::map<std::string, std::string>;

struct HttpResponse {
  int status{0};
  HeaderMap headers;
  std::string body;

  std::string Header(const std::string &name) const;
};

// Status line and headers of a response whose body is still on the wire.
struct HttpResponseHead {
  int status{0};
  std::string reason;
  HeaderMap headers;

  std::string Header(const std::string &name) const;
  bool IsChunked() const;
};

// Blocking HTTP/1.1 client over POSIX sockets and OpenSSL. One connection per
// request ("Connection: close"). Safe to share across threads once built.
class HttpClient {
public:
  struct RawConnection {
    int sock{-1};
    SSL *ssl{nullptr};
    // TLS session to an https:// proxy; the target stream runs inside it.
    SSL *proxy_ssl{nullptr};
  };

  explicit HttpClient(HttpClientOptions options = {});
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse Get(const std::string &url,
                   const std::map<std::string, std::string> &headers = {}) const;
  // When `abort` is set, triggering it shuts the connection down and the
  // call throws std::runtime_error("request aborted").
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {},
       AbortSignal *abort = nullptr) const;

  // Returns the raw connection for streaming reads. Caller owns the
  // connection and must release it with CloseRaw(). A non-null `abort` is
  // left armed to shut the socket down; disarm it before CloseRaw().
  RawConnection
  SendRaw(const std::string &method, const std::string &url,
          const std::string &body,
          const std::map<std::string, std::string> &headers,
          AbortSignal *abort = nullptr) const;
  ssize_t RecvRaw(RawConnection &conn, char *buffer, std::size_t length) const;
  // Reads the status line and headers. Body bytes that arrived with the head
  // are returned in `leftover`. Throws std::runtime_error on failure.
  HttpResponseHead ReadHead(RawConnection &conn, std::string *leftover) const;
  void CloseRaw(RawConnection &conn) const;
  // Unblocks a reader stuck in RecvRaw() from another thread. The connection
  // must still be released by its owner.
  static void AbortRaw(const RawConnection &conn);

  const HttpClientOptions &options() const { return options_; }

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers,
                    AbortSignal *abort) const;

  HttpClientOptions options_;
  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace chatbridge
