#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class DuplexPump;

struct ClientEntry {
  uint64_t id = 0;
  std::shared_ptr<DuplexPump> pump;
  std::string remote;
};

// Connected TCP clients of a listener. Relay iterates a snapshot, so a
// client removed mid-relay is simply skipped by its failing send.
class ClientRegistry {
public:
  uint64_t add(std::shared_ptr<DuplexPump> pump, std::string remote);
  bool remove(uint64_t id);
  std::vector<ClientEntry> snapshot() const;
  std::vector<ClientEntry> take_all();
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<uint64_t, ClientEntry> clients_;
  uint64_t next_id_ = 1;
};
