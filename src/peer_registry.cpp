#include "peer_registry.hpp"

std::vector<PeerRegistry::Address> PeerRegistry::on_receive(const Address& addr, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_seen_[addr] = now;
  std::vector<Address> others;
  others.reserve(last_seen_.size());
  for(const auto& entry : last_seen_) {
    if(entry.first != addr) others.push_back(entry.first);
  }
  return others;
}

std::vector<PeerRegistry::Address> PeerRegistry::sweep(Clock::time_point now, Clock::duration idle_threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Address> evicted;
  for(auto it = last_seen_.begin(); it != last_seen_.end();) {
    if(now - it->second > idle_threshold) {
      evicted.push_back(it->first);
      it = last_seen_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}

std::vector<PeerRegistry::Address> PeerRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Address> out;
  out.reserve(last_seen_.size());
  for(const auto& entry : last_seen_) {
    out.push_back(entry.first);
  }
  return out;
}

bool PeerRegistry::contains(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_seen_.count(addr) > 0;
}

std::size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_seen_.size();
}

void PeerRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_seen_.clear();
}
