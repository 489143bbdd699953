#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "session.hpp"
#include "transport.hpp"

class InputReader;
class LocalInput;
class Logger;

// Moves bytes both ways between a Session and the local side. The inbound
// direction is an async read chain on the io_context; the outbound
// direction is an InputReader thread. Both observe the shared StopSignal
// within one poll interval.
class DuplexPump : public std::enable_shared_from_this<DuplexPump> {
public:
  struct Options {
    std::chrono::milliseconds poll_interval{200};
    // Leave the session open after local end-of-stream.
    bool keep_open = false;
    std::size_t read_chunk = 8192;
    // Local input stalls while this many bytes wait on the session.
    std::size_t max_in_flight = 256 * 1024;
  };

  enum class FinishReason { none, local_eof, peer_closed, read_error, stopped };

  using InboundHandler = std::function<void(const std::string& data, const asio::ip::udp::endpoint& from)>;
  using InputFilter = std::function<void(std::string chunk)>;
  using FinishedHandler = std::function<void(FinishReason)>;

  static std::shared_ptr<DuplexPump> create(std::shared_ptr<Session> session,
                                            std::shared_ptr<StopSignal> stop,
                                            Options options,
                                            std::shared_ptr<Logger> logger = nullptr);
  ~DuplexPump();

  DuplexPump(const DuplexPump&) = delete;
  DuplexPump& operator=(const DuplexPump&) = delete;

  // Configure before start().
  void set_inbound_handler(InboundHandler handler);
  void set_local_input(std::unique_ptr<LocalInput> input);
  // Receives local input instead of the session; the filter decides what
  // to send (the chat overlay uses this).
  void set_input_filter(InputFilter filter);
  void set_finished_handler(FinishedHandler handler);

  void start();
  void stop();

  void send(std::string data, Session::WriteHandler handler = {});

  bool finished() const { return finished_.load(); }
  FinishReason finish_reason() const;
  bool wait_for(std::chrono::milliseconds timeout);
  void wait();

  std::shared_ptr<Session> session() const { return session_; }
  uint64_t bytes_in() const { return bytes_in_.load(); }
  uint64_t bytes_out() const { return bytes_out_.load(); }
  // Bytes handed to send() whose write has not completed yet.
  std::size_t in_flight() const;

private:
  DuplexPump(std::shared_ptr<Session> session,
             std::shared_ptr<StopSignal> stop,
             Options options,
             std::shared_ptr<Logger> logger);

  void read_next();
  void schedule_watchdog();
  void start_local_input();
  void on_local_end(bool eof);
  bool wait_for_outbound(std::size_t limit);
  void finish(FinishReason reason);

  std::shared_ptr<Session> session_;
  std::shared_ptr<StopSignal> stop_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  InboundHandler inbound_handler_;
  InputFilter input_filter_;
  FinishedHandler finished_handler_;
  std::unique_ptr<LocalInput> pending_input_;
  std::unique_ptr<InputReader> reader_;

  std::vector<char> read_buffer_;
  asio::steady_timer watchdog_;
  std::atomic<bool> started_{false};
  std::atomic<bool> finished_{false};
  std::atomic<uint64_t> bytes_in_{0};
  std::atomic<uint64_t> bytes_out_{0};

  mutable std::mutex flow_mutex_;
  std::condition_variable flow_cv_;
  std::size_t in_flight_ = 0;

  mutable std::mutex finish_mutex_;
  std::condition_variable finish_cv_;
  FinishReason reason_ = FinishReason::none;
};

const char* finish_reason_name(DuplexPump::FinishReason reason);
