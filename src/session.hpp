#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "transport.hpp"

class Logger;

// One logical connection: a TCP socket (optionally TLS wrapped) or a UDP
// socket with a logical target. All socket work runs on the io_context; the
// public calls may be made from any thread.
class Session : public std::enable_shared_from_this<Session> {
public:
  enum class State { Idle, Connecting, Connected, Closing, Closed };
  enum class Role { Client, Server };

  using ConnectHandler = std::function<void(std::error_code, std::shared_ptr<Session>)>;
  using HandshakeHandler = std::function<void(std::error_code)>;
  using ReadHandler = std::function<void(std::error_code, std::size_t, const asio::ip::udp::endpoint&)>;
  using WriteHandler = std::function<void(std::error_code)>;

  struct ConnectOptions {
    std::string host;
    uint16_t port = 0;
    Protocol protocol = Protocol::tcp;
    std::shared_ptr<asio::ssl::context> tls;
    std::string server_name;
    std::chrono::milliseconds timeout{std::chrono::seconds(3)};
    // UDP: announce ourselves with one empty datagram.
    bool udp_announce = true;
  };

  // The handler always receives the session; on failure it is already
  // Closed and the error is one of connect_refused, connect_timeout,
  // resolve_failed, tls_handshake_failed or an asio code.
  static void async_connect(asio::io_context& io,
                            ConnectOptions options,
                            ConnectHandler handler,
                            std::shared_ptr<Logger> logger = nullptr);

  static std::shared_ptr<Session> accepted(asio::io_context& io,
                                           asio::ip::tcp::socket socket,
                                           std::shared_ptr<Logger> logger = nullptr);

  // Bound UDP socket on all interfaces; port 0 picks an ephemeral port.
  static std::shared_ptr<Session> listen_udp(asio::io_context& io,
                                             uint16_t port,
                                             std::error_code& ec,
                                             std::shared_ptr<Logger> logger = nullptr);

  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Wraps an accepted TCP session in TLS. Failure closes the session.
  void async_server_handshake(std::shared_ptr<asio::ssl::context> ctx,
                              std::chrono::milliseconds timeout,
                              HandshakeHandler handler);

  // For UDP a zero-length read is an empty datagram, never end-of-stream.
  // `from` is the datagram's sender (UDP only).
  void async_read_some(asio::mutable_buffer buffer, ReadHandler handler);

  // Queued writes complete in order. UDP sends go to the target.
  void send(std::string data, WriteHandler handler = {});
  void send_to(std::string data, const asio::ip::udp::endpoint& to, WriteHandler handler = {});

  // Idempotent; safe from any thread.
  void close();

  // Flushes queued writes, then closes; forced after `deadline`.
  void close_gracefully(std::chrono::milliseconds deadline);

  State state() const { return state_.load(std::memory_order_acquire); }
  bool is_connected() const { return state() == State::Connected; }
  bool is_closed() const { return state() == State::Closed; }

  Role role() const { return role_; }
  const TransportKind& transport() const { return transport_; }
  Protocol protocol() const { return is_udp(transport_) ? Protocol::udp : Protocol::tcp; }
  bool tls_enabled() const { return tls_enabled_; }

  std::string local_endpoint() const;
  std::string remote_endpoint() const;
  uint16_t local_port() const { return local_port_; }

  asio::io_context& io() { return io_; }

private:
  struct PendingWrite {
    std::string data;
    std::optional<asio::ip::udp::endpoint> to;
    WriteHandler handler;
  };

  using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;

  Session(asio::io_context& io, Role role, std::shared_ptr<Logger> logger);

  void start_connect(ConnectOptions options, ConnectHandler handler);
  void connect_tcp(const asio::ip::tcp::resolver::results_type& results);
  void start_client_handshake();
  void connect_udp(const asio::ip::udp::resolver::results_type& results);
  void finish_connect(std::error_code ec);

  void do_read(asio::mutable_buffer buffer, ReadHandler handler);
  void enqueue(PendingWrite write);
  void do_write();
  void on_write(std::error_code ec);
  void do_close();
  void record_endpoints();

  asio::ip::tcp::socket& tcp_layer();

  asio::io_context& io_;
  Role role_;
  std::shared_ptr<Logger> logger_;
  std::atomic<State> state_{State::Idle};
  TransportKind transport_{TcpTransport{}};
  bool tls_enabled_ = false;

  std::shared_ptr<asio::ssl::context> tls_context_;
  std::optional<asio::ip::tcp::socket> tcp_;
  std::unique_ptr<TlsStream> tls_;
  std::optional<asio::ip::udp::socket> udp_;
  asio::ip::udp::endpoint sender_;

  std::unique_ptr<asio::ip::tcp::resolver> tcp_resolver_;
  std::unique_ptr<asio::ip::udp::resolver> udp_resolver_;
  asio::steady_timer deadline_timer_;
  bool deadline_expired_ = false;
  ConnectOptions connect_options_;
  ConnectHandler connect_handler_;

  std::deque<PendingWrite> write_queue_;
  bool close_after_flush_ = false;

  std::string local_;
  std::string remote_;
  uint16_t local_port_ = 0;
};

const char* session_state_name(Session::State state);
