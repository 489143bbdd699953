#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "duplex_pump.hpp"
#include "peer_registry.hpp"
#include "transport.hpp"

class LocalInput;
class Logger;
class Session;

// UDP listener: every datagram registers its sender, is handed to the
// inbound handler and (when relaying) forwarded to every other known peer.
// Idle peers are swept on a fixed period independent of traffic.
class UdpRelay : public std::enable_shared_from_this<UdpRelay> {
public:
  struct Options {
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds peer_idle_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(5)};
    bool relay = true;
    bool keep_open = true;
  };

  using InboundHandler = std::function<void(const std::string& data, const std::string& from)>;
  using PeerEventHandler = std::function<void(const std::string& peer, bool joined)>;

  static std::shared_ptr<UdpRelay> create(std::shared_ptr<Session> session,
                                          std::shared_ptr<StopSignal> stop,
                                          Options options,
                                          std::shared_ptr<Logger> logger = nullptr);

  void set_inbound_handler(InboundHandler handler);
  void set_peer_event_handler(PeerEventHandler handler);
  // Operator input is fanned out to every known peer.
  void set_local_input(std::unique_ptr<LocalInput> input);
  void set_input_filter(DuplexPump::InputFilter filter);

  void start();
  void stop();
  void broadcast(const std::string& data);

  bool finished() const { return pump_->finished(); }
  bool wait_for(std::chrono::milliseconds timeout) { return pump_->wait_for(timeout); }
  const PeerRegistry& peers() const { return peers_; }
  std::shared_ptr<Session> session() const { return pump_->session(); }

private:
  UdpRelay(std::shared_ptr<Session> session,
           std::shared_ptr<StopSignal> stop,
           Options options,
           std::shared_ptr<Logger> logger);

  void on_datagram(const std::string& data, const asio::ip::udp::endpoint& from);
  void schedule_sweep();

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<DuplexPump> pump_;
  PeerRegistry peers_;
  asio::steady_timer sweep_timer_;
  InboundHandler inbound_handler_;
  PeerEventHandler peer_event_handler_;
  bool custom_filter_ = false;
};
