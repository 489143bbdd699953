#include "client_registry.hpp"

uint64_t ClientRegistry::add(std::shared_ptr<DuplexPump> pump, std::string remote) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_id_++;
  clients_.emplace(id, ClientEntry{id, std::move(pump), std::move(remote)});
  return id;
}

bool ClientRegistry::remove(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.erase(id) > 0;
}

std::vector<ClientEntry> ClientRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClientEntry> out;
  out.reserve(clients_.size());
  for(const auto& entry : clients_) {
    out.push_back(entry.second);
  }
  return out;
}

std::vector<ClientEntry> ClientRegistry::take_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClientEntry> out;
  out.reserve(clients_.size());
  for(auto& entry : clients_) {
    out.push_back(std::move(entry.second));
  }
  clients_.clear();
  return out;
}

std::size_t ClientRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.size();
}
