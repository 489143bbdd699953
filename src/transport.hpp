#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <variant>

enum class Protocol { tcp, udp };

inline const char* protocol_name(Protocol protocol) {
  return protocol == Protocol::udp ? "udp" : "tcp";
}

// Transport kind carried next to the socket. UDP has no connection, so its
// logical peer is the target the datagrams are addressed to.
struct TcpTransport {};

struct UdpTransport {
  asio::ip::udp::endpoint target;
};

using TransportKind = std::variant<TcpTransport, UdpTransport>;

inline bool is_udp(const TransportKind& kind) {
  return std::holds_alternative<UdpTransport>(kind);
}

// Shared cooperative stop flag. Every loop checks it once per poll interval.
class StopSignal {
public:
  void raise() { raised_.store(true, std::memory_order_release); }
  bool raised() const { return raised_.load(std::memory_order_acquire); }
  void reset() { raised_.store(false, std::memory_order_release); }

private:
  std::atomic<bool> raised_{false};
};

struct Timeouts {
  std::chrono::milliseconds connect{std::chrono::seconds(3)};
  std::chrono::milliseconds accept_poll{200};
  std::chrono::milliseconds idle_read{std::chrono::seconds(10)};
  std::chrono::milliseconds handshake{std::chrono::seconds(10)};
};
