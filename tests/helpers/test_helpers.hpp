#pragma once

#include "skyhost/config/schema.hpp"
#include "skyhost/fleet/topology.hpp"
#include "skyhost/net/http_client.hpp"
#include "skyhost/net/websocket_probe.hpp"
#include "skyhost/process/runner.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace skyhost::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  void create_dir(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Config whose fleet paths point into the workspace and whose observer is silent.
config::Config temp_config(const TempWorkspace &workspace);

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();
};

/// Scripted ICommandRunner. Responses are matched on the longest registered prefix of
/// the space-joined argv; unmatched commands exit 0 with no output.
class FakeCommandRunner final : public process::ICommandRunner {
public:
  struct Call {
    std::vector<std::string> argv;
    process::CommandOptions options;
  };

  void on(const std::string &command_prefix, process::ProcessResult result);

  [[nodiscard]] common::Result<process::ProcessResult>
  run(const std::vector<std::string> &argv, const process::CommandOptions &options = {}) override;

  [[nodiscard]] std::vector<Call> calls() const;
  [[nodiscard]] std::optional<Call> find_call(const std::string &command_prefix) const;

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, process::ProcessResult>> responses_;
  std::vector<Call> calls_;
};

/// Answers by exact URL; unknown URLs fail like a refused connection.
class FakeHttpClient final : public net::HttpClient {
public:
  void respond(const std::string &url, std::uint16_t status);
  void fail(const std::string &url, std::string message, bool timeout = false);

  [[nodiscard]] net::HttpResponse get(const std::string &url,
                                      const net::HttpRequestOptions &options) override;

  [[nodiscard]] std::vector<std::string> requested_urls() const;
  [[nodiscard]] std::optional<net::HttpRequestOptions> last_options() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, net::HttpResponse> responses_;
  std::vector<std::string> requested_;
  std::optional<net::HttpRequestOptions> last_options_;
};

class FakeWebSocketProber final : public net::WebSocketProber {
public:
  explicit FakeWebSocketProber(net::WebSocketProbeResult result) : result_(std::move(result)) {}

  [[nodiscard]] net::WebSocketProbeResult handshake(const std::string &url,
                                                    std::chrono::milliseconds timeout) override;

  [[nodiscard]] const std::vector<std::string> &urls() const { return urls_; }

private:
  net::WebSocketProbeResult result_;
  std::vector<std::string> urls_;
};

class FakeTopologySource final : public fleet::ITopologySource {
public:
  void set_topology(fleet::Topology topology);
  void set_error(std::string message);
  void set_service(const std::string &name, fleet::ProcessState state);

  [[nodiscard]] common::Result<fleet::Topology> query_topology() override;
  [[nodiscard]] int queries() const { return queries_; }

private:
  fleet::Topology topology_;
  std::optional<std::string> error_;
  int queries_ = 0;
};

/// Minimal HTTP server on 127.0.0.1 that hands each request head to a handler and
/// writes back whatever raw response it returns.
class LoopbackServer {
public:
  using Handler = std::function<std::string(const std::string &request)>;

  explicit LoopbackServer(Handler handler,
                          std::chrono::milliseconds delay = std::chrono::milliseconds(0));
  ~LoopbackServer();

  LoopbackServer(const LoopbackServer &) = delete;
  LoopbackServer &operator=(const LoopbackServer &) = delete;

  /// Fails when sockets are not permitted in the sandbox.
  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] std::uint16_t port() const { return port_; }
  [[nodiscard]] std::string base_url() const;
  [[nodiscard]] int requests() const { return requests_.load(); }

private:
  void serve();

  Handler handler_;
  std::chrono::milliseconds delay_;
  int listen_fd_ = -1;
  std::uint16_t port_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<int> requests_{0};
  std::thread thread_;
};

/// TLS listener on 127.0.0.1 with a throwaway self-signed certificate. Every
/// connection completes the TLS handshake and is then aborted with a TCP reset.
class TlsResetServer {
public:
  TlsResetServer() = default;
  ~TlsResetServer();

  TlsResetServer(const TlsResetServer &) = delete;
  TlsResetServer &operator=(const TlsResetServer &) = delete;

  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] std::string url(const std::string &path) const;
  [[nodiscard]] int handshakes() const { return handshakes_.load(); }

private:
  void serve();

  SSL_CTX *ctx_ = nullptr;
  int listen_fd_ = -1;
  std::uint16_t port_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<int> handshakes_{0};
  std::thread thread_;
};

/// Canned responses for LoopbackServer handlers.
[[nodiscard]] std::string http_response(std::uint16_t status, const std::string &reason,
                                        const std::string &body = "");
[[nodiscard]] std::string websocket_upgrade_response(const std::string &request);

/// Header value from a raw request head, matched case-insensitively.
[[nodiscard]] std::string request_header(const std::string &request, const std::string &name);

/// A local port with nothing listening on it.
[[nodiscard]] std::uint16_t unused_port();

} // namespace skyhost::testing
