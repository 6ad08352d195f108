#pragma once

#include "skyhost/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace skyhost::net {

struct ParsedUrl {
  bool tls = false;
  std::string host;
  std::uint16_t port = 0;
  std::string path = "/";
};

/// Accepts http, https, ws and wss URLs.
[[nodiscard]] common::Result<ParsedUrl> parse_url(const std::string &url);

/// Sec-WebSocket-Accept value a server must answer for the given client key (RFC 6455).
[[nodiscard]] std::string websocket_accept(const std::string &client_key);

/// Random base64-encoded 16-byte Sec-WebSocket-Key.
[[nodiscard]] std::string random_websocket_key();

struct WebSocketProbeResult {
  bool upgraded = false;
  std::uint16_t status = 0;
  std::string message;
};

class WebSocketProber {
public:
  virtual ~WebSocketProber() = default;
  /// Performs an opening handshake and closes the connection. Never throws.
  [[nodiscard]] virtual WebSocketProbeResult handshake(const std::string &url,
                                                       std::chrono::milliseconds timeout) = 0;
};

/// Plain TCP for http/ws, OpenSSL for https/wss. Certificates are not verified.
class SocketWebSocketProber final : public WebSocketProber {
public:
  [[nodiscard]] WebSocketProbeResult handshake(const std::string &url,
                                               std::chrono::milliseconds timeout) override;
};

} // namespace skyhost::net
