#include "net/http_client.h"

#include "net/chunked_decoder.h"
#include "net/encoding.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace chatbridge {
namespace {

constexpr std::size_t kMaxHeadBytes = 64 * 1024;

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string &value) {
  auto s = value.find_first_not_of(" \t");
  auto e = value.find_last_not_of(" \t\r\n");
  return s == std::string::npos ? std::string() : value.substr(s, e - s + 1);
}

int ParsePort(const std::string &text) {
  std::size_t consumed = 0;
  int port = 0;
  try {
    port = std::stoi(text, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("invalid port '" + text + "'");
  }
  if (consumed != text.size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("invalid port '" + text + "'");
  }
  return port;
}

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = ToLower(url.substr(0, scheme_pos));
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    parsed.port = ParsePort(host_port.substr(colon + 1));
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

std::string Authority(const ParsedUrl &parsed) {
  bool default_port = (parsed.use_tls && parsed.port == 443) ||
                      (!parsed.use_tls && parsed.port == 80);
  return default_port ? parsed.host
                      : parsed.host + ":" + std::to_string(parsed.port);
}

std::string FindHeader(const HeaderMap &headers, const std::string &name) {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool ConnectWithTimeout(int sock, const sockaddr *addr, socklen_t addr_len,
                        int timeout_seconds) {
  int flags = ::fcntl(sock, F_GETFL, 0);
  if (flags < 0 || ::fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
    return ::connect(sock, addr, addr_len) == 0;
  }
  bool connected = false;
  int rc = ::connect(sock, addr, addr_len);
  if (rc == 0) {
    connected = true;
  } else if (errno == EINPROGRESS) {
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLOUT;
    int timeout_ms = timeout_seconds > 0 ? timeout_seconds * 1000 : -1;
    if (::poll(&pfd, 1, timeout_ms) == 1) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
          so_error == 0) {
        connected = true;
      }
    }
  }
  ::fcntl(sock, F_SETFL, flags);
  return connected;
}

int CreateSocket(const std::string &host, int port,
                 const HttpClientOptions &options) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints,
                  &result) != 0) {
    throw std::runtime_error("failed to resolve host " + host);
  }
  int sock = -1;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (ConnectWithTimeout(sock, rp->ai_addr, rp->ai_addrlen,
                           options.connect_timeout_seconds))
      break;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1)
    throw std::runtime_error("failed to connect to " + host + ":" +
                             std::to_string(port));
  struct timeval tv;
  tv.tv_sec = options.read_timeout_seconds > 0 ? options.read_timeout_seconds
                                               : 0;
  tv.tv_usec = 0;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return sock;
}

SSL *ActiveTls(const HttpClient::RawConnection &conn) {
  return conn.ssl ? conn.ssl : conn.proxy_ssl;
}

bool WriteAll(HttpClient::RawConnection &conn, const char *data,
              std::size_t length) {
  SSL *tls = ActiveTls(conn);
  while (length > 0) {
    if (tls) {
      int sent = SSL_write(tls, data, static_cast<int>(length));
      if (sent <= 0) {
        int err = SSL_get_error(tls, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
      data += sent;
      length -= static_cast<std::size_t>(sent);
    } else {
      ssize_t sent = ::send(conn.sock, data, length, MSG_NOSIGNAL);
      if (sent <= 0) {
        if (sent < 0 && errno == EINTR) {
          continue;
        }
        return false;
      }
      data += sent;
      length -= static_cast<std::size_t>(sent);
    }
  }
  return true;
}

bool WriteAll(HttpClient::RawConnection &conn, const std::string &payload) {
  return WriteAll(conn, payload.data(), payload.size());
}

ssize_t ReadSome(HttpClient::RawConnection &conn, char *buffer,
                 std::size_t length) {
  SSL *tls = ActiveTls(conn);
  if (tls) {
    while (true) {
      int received = SSL_read(tls, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(tls, received);
      if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
      }
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        // Blocking socket: WANT_READ only surfaces on SO_RCVTIMEO expiry.
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return -1;
        }
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

bool ReadExact(HttpClient::RawConnection &conn, unsigned char *buffer,
               std::size_t length) {
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ReadSome(conn, reinterpret_cast<char *>(buffer) + total,
                         length - total);
    if (n <= 0) {
      return false;
    }
    total += static_cast<std::size_t>(n);
  }
  return true;
}

HttpResponseHead ParseHead(const std::string &head) {
  HttpResponseHead parsed;
  auto line_end = head.find("\r\n");
  std::string status_line = head.substr(0, line_end);
  auto first_space = status_line.find(' ');
  if (status_line.compare(0, 5, "HTTP/") != 0 ||
      first_space == std::string::npos) {
    throw std::runtime_error("malformed status line: " + status_line);
  }
  auto second_space = status_line.find(' ', first_space + 1);
  try {
    parsed.status = std::stoi(
        status_line.substr(first_space + 1, second_space - first_space - 1));
  } catch (const std::exception &) {
    throw std::runtime_error("malformed status line: " + status_line);
  }
  if (second_space != std::string::npos) {
    parsed.reason = status_line.substr(second_space + 1);
  }

  std::size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    pos = end + 2;
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    auto name = ToLower(Trim(line.substr(0, colon)));
    auto value = Trim(line.substr(colon + 1));
    auto existing = parsed.headers.find(name);
    if (existing == parsed.headers.end()) {
      parsed.headers.emplace(name, value);
    } else {
      existing->second += ", " + value;
    }
  }
  return parsed;
}

HttpResponseHead ReadHeadFrom(HttpClient::RawConnection &conn,
                              std::string *leftover) {
  std::string buffer;
  char chunk[4096];
  while (true) {
    auto pos = buffer.find("\r\n\r\n");
    if (pos != std::string::npos) {
      if (leftover) {
        *leftover = buffer.substr(pos + 4);
      }
      return ParseHead(buffer.substr(0, pos));
    }
    if (buffer.size() > kMaxHeadBytes) {
      throw std::runtime_error("response headers too large");
    }
    ssize_t n = ReadSome(conn, chunk, sizeof(chunk));
    if (n == 0) {
      throw std::runtime_error("connection closed before response headers");
    }
    if (n < 0) {
      throw std::runtime_error("failed to read response headers");
    }
    buffer.append(chunk, static_cast<std::size_t>(n));
  }
}

void ReleaseConnection(HttpClient::RawConnection &conn) {
  if (conn.ssl) {
    SSL_shutdown(conn.ssl);
    SSL_free(conn.ssl);
    conn.ssl = nullptr;
  }
  if (conn.proxy_ssl) {
    SSL_shutdown(conn.proxy_ssl);
    SSL_free(conn.proxy_ssl);
    conn.proxy_ssl = nullptr;
  }
  if (conn.sock >= 0) {
    ::close(conn.sock);
    conn.sock = -1;
  }
}

// Establishes TLS to `host` either directly on `sock` or nested inside
// `outer` (an https:// proxy session).
SSL *TlsConnect(SSL_CTX *ctx, int sock, SSL *outer, const std::string &host) {
  if (!ctx) {
    throw std::runtime_error("TLS not available in HttpClient");
  }
  SSL *ssl = SSL_new(ctx);
  if (!ssl) {
    throw std::runtime_error("failed to allocate TLS context");
  }
  SSL_set_tlsext_host_name(ssl, host.c_str());
  SSL_set1_host(ssl, host.c_str());
  if (outer) {
    BIO *tunnel = BIO_new(BIO_f_ssl());
    if (!tunnel) {
      SSL_free(ssl);
      throw std::runtime_error("failed to allocate TLS tunnel");
    }
    BIO_set_ssl(tunnel, outer, BIO_NOCLOSE);
    SSL_set_bio(ssl, tunnel, tunnel);
  } else {
    SSL_set_fd(ssl, sock);
  }
  if (SSL_connect(ssl) != 1) {
    SSL_free(ssl);
    throw std::runtime_error("TLS handshake failed with " + host);
  }
  if (SSL_get_verify_result(ssl) != X509_V_OK) {
    SSL_shutdown(ssl);
    SSL_free(ssl);
    throw std::runtime_error("TLS certificate verification failed for " +
                             host);
  }
  return ssl;
}

std::string ProxyAuthorization(const ProxyConfig &proxy) {
  if (proxy.username.empty()) {
    return {};
  }
  return "Basic " + Base64Encode(proxy.username + ":" + proxy.password);
}

void HttpConnectTunnel(HttpClient::RawConnection &conn,
                       const ProxyConfig &proxy, const ParsedUrl &target) {
  std::string authority = target.host + ":" + std::to_string(target.port);
  std::ostringstream request;
  request << "CONNECT " << authority << " HTTP/1.1\r\n";
  request << "Host: " << authority << "\r\n";
  auto auth = ProxyAuthorization(proxy);
  if (!auth.empty()) {
    request << "Proxy-Authorization: " << auth << "\r\n";
  }
  request << "\r\n";
  if (!WriteAll(conn, request.str())) {
    throw std::runtime_error("failed to send proxy CONNECT");
  }
  auto head = ReadHeadFrom(conn, nullptr);
  if (head.status < 200 || head.status >= 300) {
    throw std::runtime_error("proxy CONNECT failed with status " +
                             std::to_string(head.status));
  }
}

// RFC 1928 / RFC 1929.
void Socks5Handshake(HttpClient::RawConnection &conn, const ProxyConfig &proxy,
                     const ParsedUrl &target) {
  bool with_auth = !proxy.username.empty();
  std::string greeting = with_auth ? std::string("\x05\x02\x00\x02", 4)
                                   : std::string("\x05\x01\x00", 3);
  if (!WriteAll(conn, greeting)) {
    throw std::runtime_error("failed to send SOCKS5 greeting");
  }
  unsigned char reply[4];
  if (!ReadExact(conn, reply, 2) || reply[0] != 0x05) {
    throw std::runtime_error("invalid SOCKS5 greeting reply");
  }
  if (reply[1] == 0x02 && with_auth) {
    if (proxy.username.size() > 255 || proxy.password.size() > 255) {
      throw std::runtime_error("SOCKS5 credentials too long");
    }
    std::string auth;
    auth.push_back('\x01');
    auth.push_back(static_cast<char>(proxy.username.size()));
    auth += proxy.username;
    auth.push_back(static_cast<char>(proxy.password.size()));
    auth += proxy.password;
    if (!WriteAll(conn, auth) || !ReadExact(conn, reply, 2)) {
      throw std::runtime_error("SOCKS5 authentication failed");
    }
    if (reply[1] != 0x00) {
      throw std::runtime_error("SOCKS5 authentication rejected");
    }
  } else if (reply[1] != 0x00) {
    throw std::runtime_error("SOCKS5 proxy offered no acceptable method");
  }

  std::string request("\x05\x01\x00", 3);
  if (proxy.remote_dns) {
    if (target.host.size() > 255) {
      throw std::runtime_error("SOCKS5 target host too long");
    }
    request.push_back('\x03');
    request.push_back(static_cast<char>(target.host.size()));
    request += target.host;
  } else {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *result = nullptr;
    if (getaddrinfo(target.host.c_str(), nullptr, &hints, &result) != 0 ||
        result == nullptr) {
      throw std::runtime_error("failed to resolve host " + target.host);
    }
    if (result->ai_family == AF_INET) {
      auto *addr = reinterpret_cast<sockaddr_in *>(result->ai_addr);
      request.push_back('\x01');
      request.append(reinterpret_cast<const char *>(&addr->sin_addr), 4);
    } else {
      auto *addr = reinterpret_cast<sockaddr_in6 *>(result->ai_addr);
      request.push_back('\x04');
      request.append(reinterpret_cast<const char *>(&addr->sin6_addr), 16);
    }
    freeaddrinfo(result);
  }
  request.push_back(static_cast<char>((target.port >> 8) & 0xff));
  request.push_back(static_cast<char>(target.port & 0xff));
  if (!WriteAll(conn, request)) {
    throw std::runtime_error("failed to send SOCKS5 connect request");
  }
  if (!ReadExact(conn, reply, 4) || reply[0] != 0x05) {
    throw std::runtime_error("invalid SOCKS5 connect reply");
  }
  if (reply[1] != 0x00) {
    throw std::runtime_error("SOCKS5 connect failed with code " +
                             std::to_string(static_cast<int>(reply[1])));
  }
  std::size_t skip = 0;
  if (reply[3] == 0x01) {
    skip = 4 + 2;
  } else if (reply[3] == 0x04) {
    skip = 16 + 2;
  } else if (reply[3] == 0x03) {
    unsigned char len = 0;
    if (!ReadExact(conn, &len, 1)) {
      throw std::runtime_error("invalid SOCKS5 connect reply");
    }
    skip = static_cast<std::size_t>(len) + 2;
  } else {
    throw std::runtime_error("invalid SOCKS5 address type");
  }
  unsigned char bound[258];
  if (!ReadExact(conn, bound, skip)) {
    throw std::runtime_error("invalid SOCKS5 connect reply");
  }
}

void DisarmAndRelease(HttpClient::RawConnection &conn, AbortSignal *abort) {
  if (abort) {
    abort->Disarm();
  }
  ReleaseConnection(conn);
}

// Arms `abort` (when set) as soon as the socket exists, so proxy and TLS
// handshakes can be cut short too.
HttpClient::RawConnection OpenConnection(const ParsedUrl &target,
                                         const HttpClientOptions &options,
                                         SSL_CTX *ctx, AbortSignal *abort) {
  const auto &proxy = options.proxy;
  HttpClient::RawConnection conn;
  conn.sock = proxy.enabled() ? CreateSocket(proxy.host, proxy.port, options)
                              : CreateSocket(target.host, target.port, options);
  if (abort && !abort->Arm([sock = conn.sock] { ::shutdown(sock, SHUT_RDWR); })) {
    ReleaseConnection(conn);
    throw std::runtime_error("request aborted");
  }
  try {
    if (proxy.kind == ProxyConfig::Kind::kHttps) {
      conn.proxy_ssl = TlsConnect(ctx, conn.sock, nullptr, proxy.host);
    }
    if (proxy.kind == ProxyConfig::Kind::kSocks5) {
      Socks5Handshake(conn, proxy, target);
    } else if (proxy.enabled() && target.use_tls) {
      HttpConnectTunnel(conn, proxy, target);
    }
    if (target.use_tls) {
      conn.ssl = TlsConnect(ctx, conn.sock, conn.proxy_ssl, target.host);
    }
  } catch (const std::exception &) {
    DisarmAndRelease(conn, abort);
    if (abort && abort->triggered()) {
      throw std::runtime_error("request aborted");
    }
    throw;
  }
  return conn;
}

std::string BuildRequest(const ParsedUrl &parsed,
                         const std::string &request_target,
                         const std::string &method, const std::string &body,
                         const std::map<std::string, std::string> &headers,
                         const std::string &proxy_authorization) {
  bool has_content_type = false;
  for (const auto &[key, value] : headers) {
    if (ToLower(key) == "content-type") {
      has_content_type = true;
    }
  }
  std::ostringstream request;
  request << method << " " << request_target << " HTTP/1.1\r\n";
  request << "Host: " << Authority(parsed) << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  if (!has_content_type) {
    request << "Content-Type: application/json\r\n";
  }
  if (!proxy_authorization.empty()) {
    request << "Proxy-Authorization: " << proxy_authorization << "\r\n";
  }
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}
} // namespace

ProxyConfig ParseProxyUrl(const std::string &url) {
  ProxyConfig proxy;
  if (url.empty()) {
    return proxy;
  }
  auto scheme_pos = url.find("://");
  if (scheme_pos == std::string::npos) {
    throw std::invalid_argument("proxy URL must include a scheme");
  }
  auto scheme = ToLower(url.substr(0, scheme_pos));
  if (scheme == "http") {
    proxy.kind = ProxyConfig::Kind::kHttp;
    proxy.port = 80;
  } else if (scheme == "https") {
    proxy.kind = ProxyConfig::Kind::kHttps;
    proxy.port = 443;
  } else if (scheme == "socks5" || scheme == "socks5h") {
    proxy.kind = ProxyConfig::Kind::kSocks5;
    proxy.port = 1080;
    proxy.remote_dns = (scheme == "socks5h");
  } else {
    throw std::invalid_argument("unsupported proxy scheme '" + scheme + "'");
  }

  std::string remainder = url.substr(scheme_pos + 3);
  auto slash = remainder.find('/');
  if (slash != std::string::npos) {
    remainder = remainder.substr(0, slash);
  }
  auto at = remainder.rfind('@');
  if (at != std::string::npos) {
    std::string userinfo = remainder.substr(0, at);
    remainder = remainder.substr(at + 1);
    auto colon = userinfo.find(':');
    proxy.username = userinfo.substr(0, colon);
    if (colon != std::string::npos) {
      proxy.password = userinfo.substr(colon + 1);
    }
  }
  auto colon = remainder.rfind(':');
  if (colon != std::string::npos) {
    proxy.host = remainder.substr(0, colon);
    proxy.port = ParsePort(remainder.substr(colon + 1));
  } else {
    proxy.host = remainder;
  }
  if (proxy.host.empty()) {
    throw std::invalid_argument("proxy URL has no host");
  }
  return proxy;
}

std::string HttpResponse::Header(const std::string &name) const {
  return FindHeader(headers, name);
}

std::string HttpResponseHead::Header(const std::string &name) const {
  return FindHeader(headers, name);
}

bool HttpResponseHead::IsChunked() const {
  return ToLower(Header("transfer-encoding")).find("chunked") !=
         std::string::npos;
}

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)) {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ssl_ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers, nullptr);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers,
                 AbortSignal *abort) const {
  return Send("POST", url, body, headers, abort);
}

HttpClient::RawConnection
HttpClient::SendRaw(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers,
                    AbortSignal *abort) const {
  auto parsed = ParseUrl(url);
  RawConnection conn = OpenConnection(
      parsed, options_, tls_ready_ ? ssl_ctx_ : nullptr, abort);

  // Plain-HTTP targets behind an HTTP proxy use the absolute-form request.
  std::string request_target = parsed.path;
  std::string proxy_authorization;
  bool forward_proxy = !parsed.use_tls &&
                       (options_.proxy.kind == ProxyConfig::Kind::kHttp ||
                        options_.proxy.kind == ProxyConfig::Kind::kHttps);
  if (forward_proxy) {
    request_target = "http://" + parsed.host + ":" +
                     std::to_string(parsed.port) + parsed.path;
    proxy_authorization = ProxyAuthorization(options_.proxy);
  }

  auto payload = BuildRequest(parsed, request_target, method, body, headers,
                              proxy_authorization);
  if (!WriteAll(conn, payload)) {
    DisarmAndRelease(conn, abort);
    if (abort && abort->triggered()) {
      throw std::runtime_error("request aborted");
    }
    throw std::runtime_error(parsed.use_tls ? "failed to send TLS request"
                                            : "failed to send request");
  }
  return conn;
}

ssize_t HttpClient::RecvRaw(RawConnection &conn, char *buffer,
                            std::size_t length) const {
  return ReadSome(conn, buffer, length);
}

HttpResponseHead HttpClient::ReadHead(RawConnection &conn,
                                      std::string *leftover) const {
  return ReadHeadFrom(conn, leftover);
}

void HttpClient::CloseRaw(RawConnection &conn) const {
  ReleaseConnection(conn);
}

void HttpClient::AbortRaw(const RawConnection &conn) {
  if (conn.sock >= 0) {
    ::shutdown(conn.sock, SHUT_RDWR);
  }
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers,
                 AbortSignal *abort) const {
  if (abort && abort->triggered()) {
    throw std::runtime_error("request aborted");
  }
  RawConnection conn = SendRaw(method, url, body, headers, abort);
  HttpResponse http_response;
  try {
    std::string leftover;
    auto head = ReadHeadFrom(conn, &leftover);
    http_response.status = head.status;
    http_response.headers = head.headers;

    char buffer[4096];
    if (head.status == 204 || head.status == 304) {
      // No body.
    } else if (head.IsChunked()) {
      ChunkedDecoder decoder;
      if (!decoder.Feed(leftover, &http_response.body)) {
        throw std::runtime_error("malformed chunked response body");
      }
      while (!decoder.Finished()) {
        ssize_t n = ReadSome(conn, buffer, sizeof(buffer));
        if (n <= 0) {
          break;
        }
        if (!decoder.Feed(buffer, static_cast<std::size_t>(n),
                          &http_response.body)) {
          throw std::runtime_error("malformed chunked response body");
        }
      }
    } else if (!head.Header("content-length").empty()) {
      std::size_t expected = 0;
      try {
        expected = std::stoull(head.Header("content-length"));
      } catch (const std::exception &) {
        throw std::runtime_error("invalid Content-Length in response");
      }
      http_response.body = std::move(leftover);
      while (http_response.body.size() < expected) {
        ssize_t n = ReadSome(conn, buffer, sizeof(buffer));
        if (n <= 0) {
          break;
        }
        http_response.body.append(buffer, static_cast<std::size_t>(n));
      }
      if (http_response.body.size() > expected) {
        http_response.body.resize(expected);
      }
    } else {
      http_response.body = std::move(leftover);
      ssize_t n = 0;
      while ((n = ReadSome(conn, buffer, sizeof(buffer))) > 0) {
        http_response.body.append(buffer, static_cast<std::size_t>(n));
      }
    }
  } catch (const std::exception &) {
    DisarmAndRelease(conn, abort);
    if (abort && abort->triggered()) {
      throw std::runtime_error("request aborted");
    }
    throw;
  }
  DisarmAndRelease(conn, abort);
  if (abort && abort->triggered()) {
    throw std::runtime_error("request aborted");
  }
  return http_response;
}

} // namespace chatbridge
