#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

// UDP correspondents of a listener. Only on_receive adds an address; only
// sweep or clear removes one.
class PeerRegistry {
public:
  using Clock = std::chrono::steady_clock;
  using Address = asio::ip::udp::endpoint;

  // Records `addr` as seen at `now` and returns every other known address.
  std::vector<Address> on_receive(const Address& addr, Clock::time_point now = Clock::now());

  // Drops entries silent for longer than `idle_threshold`; returns them.
  std::vector<Address> sweep(Clock::time_point now, Clock::duration idle_threshold);

  std::vector<Address> snapshot() const;
  bool contains(const Address& addr) const;
  std::size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::map<Address, Clock::time_point> last_seen_;
};
