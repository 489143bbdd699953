#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <termios.h>

// Source of operator bytes for the outbound direction. `read` never blocks
// longer than `wait`, so callers observe a stop request within one wait.
class LocalInput {
public:
  enum class Status { data, timeout, eof, error };

  struct Result {
    Status status = Status::timeout;
    std::size_t bytes = 0;
    int error = 0;
  };

  virtual ~LocalInput() = default;
  virtual Result read(char* buffer, std::size_t size, std::chrono::milliseconds wait) = 0;
};

// poll(2) + read(2) on a file descriptor.
class FdInput : public LocalInput {
public:
  explicit FdInput(int fd, bool owns_fd = false);
  ~FdInput() override;

  FdInput(const FdInput&) = delete;
  FdInput& operator=(const FdInput&) = delete;

  Result read(char* buffer, std::size_t size, std::chrono::milliseconds wait) override;

  int fd() const { return fd_; }

private:
  int fd_;
  bool owns_fd_;
};

// Fixed bytes followed by end-of-stream.
class BufferInput : public LocalInput {
public:
  explicit BufferInput(std::string data);

  Result read(char* buffer, std::size_t size, std::chrono::milliseconds wait) override;

private:
  std::string data_;
  std::size_t offset_ = 0;
};

std::unique_ptr<LocalInput> make_stdin_input();

bool stdin_is_terminal();
bool stdout_is_terminal();

// Puts the terminal in non-canonical, no-echo mode for as long as it lives.
struct TerminalModeGuard {
  bool active = false;
  int fd = 0;
  termios original{};

  bool activate(int target_fd = 0);
  ~TerminalModeGuard();
};

// Drives a LocalInput on its own thread until end-of-stream, an error, or
// `should_stop` returns true.
class InputReader {
public:
  using DataHandler = std::function<void(std::string)>;
  using EndHandler = std::function<void(LocalInput::Status)>;
  using StopPredicate = std::function<bool()>;

  InputReader(std::unique_ptr<LocalInput> input,
              std::chrono::milliseconds poll_interval,
              std::size_t chunk_size = 8192);
  ~InputReader();

  InputReader(const InputReader&) = delete;
  InputReader& operator=(const InputReader&) = delete;

  void start(DataHandler on_data, EndHandler on_end, StopPredicate should_stop);
  void stop();
  void join();
  bool running() const { return state_->running.load(); }

private:
  // Owned jointly with the thread, which may outlive a detached reader.
  struct State {
    std::unique_ptr<LocalInput> input;
    std::chrono::milliseconds poll_interval{200};
    std::size_t chunk_size = 8192;
    std::atomic<bool> stop{false};
    std::atomic<bool> running{false};
  };

  static void run(std::shared_ptr<State> state,
                  DataHandler on_data,
                  EndHandler on_end,
                  StopPredicate should_stop);

  std::shared_ptr<State> state_;
  std::thread thread_;
};
