#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client_registry.hpp"
#include "transfer_codec.hpp"
#include "transport.hpp"

class Logger;
class Session;

// TCP listener. Each accepted connection (TLS wrapped when a context is
// given) either runs one file exchange or joins the client registry with
// its own DuplexPump. One client's failure never affects the others.
class Acceptor : public std::enable_shared_from_this<Acceptor> {
public:
  enum class Mode { duplex, send_file, receive_file };

  struct Options {
    Mode mode = Mode::duplex;
    // Relay data from one client to every other client.
    bool broadcast = true;
    // File modes: keep serving after the first exchange.
    bool keep_open = false;
    std::filesystem::path file;
    std::chrono::milliseconds poll_interval{200};
    Timeouts timeouts;
    std::shared_ptr<asio::ssl::context> tls;
  };

  using InboundHandler = std::function<void(const std::string& data, const std::string& from)>;
  using ClientEventHandler = std::function<void(const std::string& remote, bool connected)>;
  using TransferDoneHandler = std::function<void(const TransferResult& result)>;

  // Binds 0.0.0.0:port (0 picks an ephemeral port). Returns null with
  // NdogError::bind_failed when the port is unavailable.
  static std::shared_ptr<Acceptor> listen(asio::io_context& io,
                                          uint16_t port,
                                          Options options,
                                          std::shared_ptr<StopSignal> stop,
                                          std::error_code& ec,
                                          std::shared_ptr<Logger> logger = nullptr);

  // Configure before start().
  void set_inbound_handler(InboundHandler handler);
  void set_client_event_handler(ClientEventHandler handler);
  void set_transfer_handler(TransferDoneHandler handler);

  void start();

  // Stops accepting, force-closes every client, then closes the socket.
  void stop();

  // Operator input to every connected client.
  void broadcast(const std::string& data);

  bool stopped() const { return stopping_.load(); }
  std::size_t client_count() const { return clients_.size(); }
  uint64_t accepted_count() const { return accepted_.load(); }
  uint16_t port() const { return port_; }
  // Accepted TLS sessions whose handshake has not finished.
  std::size_t pending_handshakes() const;

private:
  Acceptor(asio::io_context& io,
           Options options,
           std::shared_ptr<StopSignal> stop,
           std::shared_ptr<Logger> logger);

  void do_accept();
  void schedule_watchdog();
  void on_accepted(asio::ip::tcp::socket socket);
  void serve(std::shared_ptr<Session> session);
  void serve_duplex(std::shared_ptr<Session> session);
  void serve_transfer(std::shared_ptr<Session> session);
  void relay(uint64_t from_id, const std::string& data);
  void do_stop();

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<StopSignal> stop_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer watchdog_;
  asio::steady_timer retry_timer_;
  uint16_t port_ = 0;

  ClientRegistry clients_;
  // Sessions outside clients_ that do_stop() must still close.
  mutable std::mutex tracked_mutex_;
  std::vector<std::weak_ptr<Session>> handshakes_;
  std::vector<std::weak_ptr<Session>> transfers_;

  InboundHandler inbound_handler_;
  ClientEventHandler client_event_handler_;
  TransferDoneHandler transfer_handler_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> accepted_{0};
};
