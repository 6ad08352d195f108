#include "skyhost/net/websocket_probe.hpp"

#include "skyhost/common/fs.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <random>
#include <sstream>
#include <unordered_map>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace skyhost::net {

namespace {

constexpr const char *kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr std::size_t kMaxHandshakeBytes = 16 * 1024;

std::string base64_encode(const unsigned char *data, const std::size_t size) {
  const int out_len = 4 * static_cast<int>((size + 2) / 3);
  std::string out(static_cast<std::size_t>(out_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data, static_cast<int>(size));
  return out;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return buffer.data();
}

class Socket {
public:
  explicit Socket(const int fd) : fd_(fd) {}
  ~Socket() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;

  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_ = -1;
};

struct SslCtxDeleter {
  void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
};
struct SslDeleter {
  void operator()(SSL *ssl) const {
    SSL_shutdown(ssl);
    SSL_free(ssl);
  }
};

// Socket BIO for the TLS session. Writes use MSG_NOSIGNAL so a peer that resets the
// connection fails the write with EPIPE instead of raising SIGPIPE.
int bio_fd(BIO *bio) {
  return static_cast<int>(reinterpret_cast<std::intptr_t>(BIO_get_data(bio)));
}

bool retryable(const int error) {
  return error == EAGAIN || error == EWOULDBLOCK || error == EINTR;
}

int nosignal_write(BIO *bio, const char *data, const int size) {
  BIO_clear_retry_flags(bio);
  const ssize_t n = ::send(bio_fd(bio), data, static_cast<std::size_t>(size), MSG_NOSIGNAL);
  if (n < 0 && retryable(errno)) {
    BIO_set_retry_write(bio);
  }
  return static_cast<int>(n);
}

int nosignal_read(BIO *bio, char *data, const int size) {
  BIO_clear_retry_flags(bio);
  const ssize_t n = ::recv(bio_fd(bio), data, static_cast<std::size_t>(size), 0);
  if (n < 0 && retryable(errno)) {
    BIO_set_retry_read(bio);
  }
  return static_cast<int>(n);
}

int nosignal_puts(BIO *bio, const char *text) {
  return nosignal_write(bio, text, static_cast<int>(std::strlen(text)));
}

long nosignal_ctrl(BIO *bio, const int cmd, long, void *ptr) {
  switch (cmd) {
  case BIO_CTRL_FLUSH:
    return 1;
  case BIO_C_GET_FD:
    if (ptr != nullptr) {
      *static_cast<int *>(ptr) = bio_fd(bio);
    }
    return bio_fd(bio);
  default:
    return 0;
  }
}

int nosignal_create(BIO *bio) {
  BIO_set_init(bio, 1);
  return 1;
}

const BIO_METHOD *nosignal_socket_method() {
  static BIO_METHOD *method = [] {
    const int index = BIO_get_new_index();
    BIO_METHOD *created = BIO_meth_new((index < 0 ? 0 : index) | BIO_TYPE_SOURCE_SINK |
                                           BIO_TYPE_DESCRIPTOR,
                                       "skyhost nosignal socket");
    if (created != nullptr) {
      BIO_meth_set_write(created, nosignal_write);
      BIO_meth_set_read(created, nosignal_read);
      BIO_meth_set_puts(created, nosignal_puts);
      BIO_meth_set_ctrl(created, nosignal_ctrl);
      BIO_meth_set_create(created, nosignal_create);
    }
    return created;
  }();
  return method;
}

common::Result<std::unique_ptr<Socket>> connect_with_timeout(const ParsedUrl &url,
                                                             const std::chrono::milliseconds timeout) {
  using ConnectResult = common::Result<std::unique_ptr<Socket>>;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *addresses = nullptr;
  const std::string port = std::to_string(url.port);
  if (const int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &addresses); rc != 0) {
    return ConnectResult::failure(common::ErrorKind::Network,
                                  "failed to resolve " + url.host + ": " + gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(addresses, &freeaddrinfo);

  std::string last_error = "no addresses";
  for (addrinfo *ai = addresses; ai != nullptr; ai = ai->ai_next) {
    auto socket_handle = std::make_unique<Socket>(socket(ai->ai_family, ai->ai_socktype, 0));
    const int fd = socket_handle->fd();
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }

    const int flags = fcntl(fd, F_GETFL, 0);
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
      rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
      if (rc == 0) {
        last_error = "connect timed out";
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      (void)getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      rc = so_error == 0 ? 0 : -1;
      errno = so_error;
    }
    if (rc != 0) {
      last_error = std::strerror(errno);
      continue;
    }

    (void)fcntl(fd, F_SETFL, flags);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return ConnectResult::success(std::move(socket_handle));
  }

  return ConnectResult::failure(common::ErrorKind::Network,
                                "websocket connect failed: " + last_error);
}

// Reads/writes over either the raw socket or the TLS session.
class Channel {
public:
  Channel(int fd, SSL *ssl) : fd_(fd), ssl_(ssl) {}

  bool write_all(const std::string &data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
      const int n = ssl_ != nullptr
                        ? SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent))
                        : static_cast<int>(::send(fd_, data.data() + sent, data.size() - sent,
                                                  MSG_NOSIGNAL));
      if (n <= 0) {
        return false;
      }
      sent += static_cast<std::size_t>(n);
    }
    return true;
  }

  int read_some(char *buffer, const std::size_t size) {
    if (ssl_ != nullptr) {
      return SSL_read(ssl_, buffer, static_cast<int>(size));
    }
    return static_cast<int>(::recv(fd_, buffer, size, 0));
  }

private:
  int fd_;
  SSL *ssl_;
};

WebSocketProbeResult evaluate_response(const std::string &response, const std::string &key) {
  WebSocketProbeResult result;
  const auto line_end = response.find("\r\n");
  const std::string status_line = response.substr(0, line_end);
  std::istringstream status_stream(status_line);
  std::string protocol;
  unsigned int status = 0;
  status_stream >> protocol >> status;
  result.status = static_cast<std::uint16_t>(status);
  if (!common::starts_with(protocol, "HTTP/") || status == 0) {
    result.message = "malformed handshake response";
    return result;
  }
  if (status != 101) {
    result.message = "handshake rejected: " + common::trim(status_line);
    return result;
  }

  std::unordered_map<std::string, std::string> headers;
  const auto header_block_end = response.find("\r\n\r\n");
  std::istringstream header_stream(
      response.substr(line_end + 2, header_block_end - line_end - 2));
  std::string line;
  while (std::getline(header_stream, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  const auto accept = headers.find("sec-websocket-accept");
  if (accept == headers.end()) {
    result.message = "handshake response missing Sec-WebSocket-Accept";
    return result;
  }
  if (accept->second != websocket_accept(key)) {
    result.message = "Sec-WebSocket-Accept mismatch";
    return result;
  }

  result.upgraded = true;
  result.message = "upgraded";
  return result;
}

} // namespace

common::Result<ParsedUrl> parse_url(const std::string &url) {
  ParsedUrl parsed;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return common::Result<ParsedUrl>::failure(common::ErrorKind::Network,
                                              "invalid url (missing scheme): " + url);
  }
  const std::string scheme = common::to_lower(url.substr(0, scheme_end));
  if (scheme == "https" || scheme == "wss") {
    parsed.tls = true;
    parsed.port = 443;
  } else if (scheme == "http" || scheme == "ws") {
    parsed.port = 80;
  } else {
    return common::Result<ParsedUrl>::failure(common::ErrorKind::Network,
                                              "unsupported url scheme: " + scheme);
  }

  const std::string rest = url.substr(scheme_end + 3);
  const auto path_start = rest.find('/');
  std::string authority = rest.substr(0, path_start);
  if (path_start != std::string::npos) {
    parsed.path = rest.substr(path_start);
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    const std::string port_text = authority.substr(colon + 1);
    unsigned int port = 0;
    const auto [ptr, ec] =
        std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 ||
        port > 65535) {
      return common::Result<ParsedUrl>::failure(common::ErrorKind::Network,
                                                "invalid port in url: " + url);
    }
    parsed.port = static_cast<std::uint16_t>(port);
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    return common::Result<ParsedUrl>::failure(common::ErrorKind::Network,
                                              "invalid url (missing host): " + url);
  }
  parsed.host = authority;
  return common::Result<ParsedUrl>::success(std::move(parsed));
}

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());
  return base64_encode(digest.data(), digest.size());
}

std::string random_websocket_key() {
  std::array<unsigned char, 16> bytes{};
  std::random_device rd;
  for (auto &byte : bytes) {
    byte = static_cast<unsigned char>(rd() & 0xFF);
  }
  return base64_encode(bytes.data(), bytes.size());
}

WebSocketProbeResult SocketWebSocketProber::handshake(const std::string &url,
                                                      const std::chrono::milliseconds timeout) {
  WebSocketProbeResult result;
  const auto parsed = parse_url(url);
  if (!parsed.ok()) {
    result.message = parsed.error();
    return result;
  }
  const auto &target = parsed.value();

  auto connected = connect_with_timeout(target, timeout);
  if (!connected.ok()) {
    result.message = connected.error();
    return result;
  }
  const int fd = connected.value()->fd();

  std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx;
  std::unique_ptr<SSL, SslDeleter> ssl;
  if (target.tls) {
    ctx.reset(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
      result.message = "failed to create TLS context: " + openssl_error_string();
      return result;
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    ssl.reset(SSL_new(ctx.get()));
    if (!ssl) {
      result.message = "failed to create TLS session: " + openssl_error_string();
      return result;
    }
    SSL_set_tlsext_host_name(ssl.get(), target.host.c_str());
    const BIO_METHOD *method = nosignal_socket_method();
    BIO *bio = method == nullptr ? nullptr : BIO_new(method);
    if (bio == nullptr) {
      result.message = "failed to create TLS transport: " + openssl_error_string();
      return result;
    }
    BIO_set_data(bio, reinterpret_cast<void *>(static_cast<std::intptr_t>(fd)));
    SSL_set_bio(ssl.get(), bio, bio);
    if (SSL_connect(ssl.get()) != 1) {
      result.message = "TLS handshake failed: " + openssl_error_string();
      return result;
    }
  }

  Channel channel(fd, ssl.get());
  const bool default_port = target.port == (target.tls ? 443 : 80);
  const std::string key = random_websocket_key();
  std::ostringstream request;
  request << "GET " << target.path << " HTTP/1.1\r\n";
  request << "Host: " << target.host;
  if (!default_port) {
    request << ":" << target.port;
  }
  request << "\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Sec-WebSocket-Key: " << key << "\r\n";
  request << "Sec-WebSocket-Version: 13\r\n";
  request << "User-Agent: skyhost/" SKYHOST_VERSION "\r\n";
  request << "\r\n";
  if (!channel.write_all(request.str())) {
    result.message = "websocket handshake send failed";
    return result;
  }

  std::string response;
  std::array<char, 1024> buffer{};
  while (response.find("\r\n\r\n") == std::string::npos) {
    const int n = channel.read_some(buffer.data(), buffer.size());
    if (n <= 0) {
      result.message = (errno == EAGAIN || errno == EWOULDBLOCK)
                           ? "websocket handshake timed out"
                           : "websocket handshake receive failed";
      return result;
    }
    response.append(buffer.data(), static_cast<std::size_t>(n));
    if (response.size() > kMaxHandshakeBytes) {
      result.message = "websocket handshake too large";
      return result;
    }
  }

  return evaluate_response(response, key);
}

} // namespace skyhost::net
