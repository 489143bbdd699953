#pragma once

#include "log.hpp"
#include "settings_manager.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace ndog::test {

// Collects lines from attached loggers so a failing test can show them.
class LogCapture {
public:
  struct Entry {
    std::string source;
    spdlog::level::level_enum level;
    std::string message;
  };

  ~LogCapture() {
    for(auto& [weak, handle] : attached_) {
      if(auto logger = weak.lock()) logger->remove_listener(handle);
    }
  }

  // `label` replaces the logger's channel name in the captured lines.
  void attach(const std::shared_ptr<Logger>& logger, std::string label = {}) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label = std::move(label)](void*, const std::string& channel,
                                       spdlog::level::level_enum level,
                                       const std::string& message) {
        record({label.empty() ? channel : label, level, message});
        return false;
      });
    std::lock_guard<std::mutex> lock(mutex_);
    attached_.emplace_back(logger, handle);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lines;
    lines.reserve(entries_.size());
    for(const auto& entry : entries_) {
      lines.push_back(entry.source + " [" + spdlog::level::to_string_view(entry.level).data() + "] " + entry.message);
    }
    return lines;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return matches(needle);
  }

  bool wait_for_substring(const std::string& needle, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&](){ return matches(needle); });
  }

private:
  void record(Entry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    cv_.notify_all();
  }

  bool matches(const std::string& needle) const {
    return std::any_of(entries_.begin(), entries_.end(),
      [&](const Entry& entry){ return entry.message.find(needle) != std::string::npos; });
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Entry> entries_;
  std::vector<std::pair<std::weak_ptr<Logger>, LogListenerHandle>> attached_;
};

struct TestContext {
  LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Polls `predicate` until it holds or `timeout` passes.
inline bool wait_for_condition(const std::function<bool()>& predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  for(auto deadline = std::chrono::steady_clock::now() + timeout;
      std::chrono::steady_clock::now() < deadline;
      std::this_thread::sleep_for(interval)) {
    if(predicate()) return true;
  }
  return predicate();
}

// io_context running on a background thread for the lifetime of the object.
class IoThread {
public:
  IoThread()
    : work_(asio::make_work_guard(io_)),
      thread_([this](){ io_.run(); }) {}

  ~IoThread() {
    work_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  IoThread(const IoThread&) = delete;
  IoThread& operator=(const IoThread&) = delete;

  asio::io_context& io() { return io_; }

private:
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread thread_;
};

// Scratch directory removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& name) {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("ndog_test_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

inline std::string random_bytes(std::size_t size, unsigned seed = 7) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string data(size, '\0');
  for(auto& c : data) {
    c = static_cast<char>(dist(rng));
  }
  return data;
}

inline void write_file(const std::filesystem::path& path, std::string_view data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) throw std::runtime_error("Unable to create " + path.string());
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::optional<std::string> read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Thread-safe sink for bytes handed over by callbacks on the io thread.
class ByteSink {
public:
  void append(std::string_view data) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.append(data.data(), data.size());
    cv_.notify_all();
  }

  std::string str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
  }

  bool wait_for_size(std::size_t size, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&](){ return data_.size() >= size; });
  }

  bool wait_for_substring(const std::string& needle, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&](){ return data_.find(needle) != std::string::npos; });
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::string data_;
};

inline void configure(SettingsManager& settings, const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!settings.set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

// Registration hooks, one per test file.
void add_transfer_codec_tests(std::vector<TestCase>& tests);
void add_registry_tests(std::vector<TestCase>& tests);
void add_session_tests(std::vector<TestCase>& tests);
void add_listener_tests(std::vector<TestCase>& tests);
void add_chat_tests(std::vector<TestCase>& tests);
void add_settings_tests(std::vector<TestCase>& tests);
void add_engine_tests(std::vector<TestCase>& tests);

} // namespace ndog::test
