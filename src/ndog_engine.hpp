#pragma once

#include <asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "console.hpp"
#include "tls.hpp"
#include "transport.hpp"

class Acceptor;
class ChatOverlay;
class DuplexPump;
class InputReader;
class LocalInput;
class Logger;
class Session;
class SettingsManager;
class UdpRelay;
struct TerminalModeGuard;
struct TransferResult;

struct EngineConfig {
  bool listen = false;
  std::string host;
  uint16_t port = 0;
  Protocol protocol = Protocol::tcp;
  bool ssl = false;
  TlsConfig tls;

  bool keep_open = false;
  bool chat = false;
  bool broadcast = true;
  bool verbose = false;
  bool show_local_ip = false;
  bool show_public_ip = false;
  Console::Options console;

  std::string send_file;
  bool receive_requested = false;
  std::string receive_file;
  std::string message;
  std::string output;

  std::chrono::milliseconds connect_timeout{std::chrono::seconds(3)};
  std::chrono::milliseconds idle_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds poll_interval{200};
  std::chrono::milliseconds peer_idle_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds peer_sweep_interval{std::chrono::seconds(5)};
};

// Throws std::runtime_error describing the first invalid combination.
EngineConfig load_engine_config(const SettingsManager& settings);

class NdogEngine {
public:
  struct Options {
    // Local input factory; stdin when unset.
    std::function<std::unique_ptr<LocalInput>()> input_factory;
    Console::Writer console_writer;
    bool handle_signals = true;
  };

  NdogEngine(std::shared_ptr<SettingsManager> settings, Options options);
  explicit NdogEngine(std::shared_ptr<SettingsManager> settings);
  ~NdogEngine();

  NdogEngine(const NdogEngine&) = delete;
  NdogEngine& operator=(const NdogEngine&) = delete;

  // Blocks until the session ends, the listener stops or a signal arrives.
  // 0 for a clean finish or interrupt, 1 for connect/bind/TLS failures.
  int run();

  // Any thread.
  void request_stop();

  // Listener port once bound (ephemeral ports resolved).
  std::optional<uint16_t> wait_for_port(std::chrono::milliseconds timeout);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void start_io();
  void stop_io();
  void finish(int exit_code);
  void publish_port(uint16_t port);
  void print_banner(uint16_t port);

  bool start_client();
  bool start_tcp_listener();
  bool start_udp_listener();
  void receive_udp_file(std::shared_ptr<Session> session);

  void on_client_connected(std::shared_ptr<Session> session);
  void start_client_pump(std::shared_ptr<Session> session);
  void report_transfer(const TransferResult& result, bool sending);
  void start_chat(std::function<void(std::string)> send,
                  std::function<std::string()> status,
                  std::function<std::string()> whoami);
  void start_listener_input(std::function<void(std::string)> sink);
  void show_inbound(const std::string& data, const std::string& from);

  std::unique_ptr<LocalInput> make_input();

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  EngineConfig config_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<Console> console_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<asio::signal_set> signals_;
  std::shared_ptr<StopSignal> stop_;

  std::shared_ptr<Session> session_;
  std::shared_ptr<DuplexPump> pump_;
  std::shared_ptr<Acceptor> acceptor_;
  std::shared_ptr<UdpRelay> relay_;
  std::unique_ptr<InputReader> listener_input_;
  std::unique_ptr<ChatOverlay> chat_;
  std::unique_ptr<TerminalModeGuard> terminal_;

  std::mutex state_mutex_;
  std::condition_variable state_cv_;
  bool finished_ = false;
  int exit_code_ = 0;
  std::optional<uint16_t> bound_port_;
};
