#include "local_io.hpp"

#include <algorithm>
#include <cerrno>
#include <vector>

#include <poll.h>
#include <unistd.h>

FdInput::FdInput(int fd, bool owns_fd)
  : fd_(fd), owns_fd_(owns_fd) {}

FdInput::~FdInput() {
  if(owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

LocalInput::Result FdInput::read(char* buffer, std::size_t size, std::chrono::milliseconds wait) {
  Result result;
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
  if(ready == 0) {
    result.status = Status::timeout;
    return result;
  }
  if(ready < 0) {
    if(errno == EINTR) {
      result.status = Status::timeout;
      return result;
    }
    result.status = Status::error;
    result.error = errno;
    return result;
  }
  if(pfd.revents & POLLNVAL) {
    result.status = Status::error;
    result.error = EBADF;
    return result;
  }

  ssize_t n = ::read(fd_, buffer, size);
  if(n > 0) {
    result.status = Status::data;
    result.bytes = static_cast<std::size_t>(n);
  } else if(n == 0) {
    result.status = Status::eof;
  } else if(errno == EINTR || errno == EAGAIN) {
    result.status = Status::timeout;
  } else {
    result.status = Status::error;
    result.error = errno;
  }
  return result;
}

BufferInput::BufferInput(std::string data)
  : data_(std::move(data)) {}

LocalInput::Result BufferInput::read(char* buffer, std::size_t size, std::chrono::milliseconds) {
  Result result;
  if(offset_ >= data_.size()) {
    result.status = Status::eof;
    return result;
  }
  std::size_t n = std::min(size, data_.size() - offset_);
  data_.copy(buffer, n, offset_);
  offset_ += n;
  result.status = Status::data;
  result.bytes = n;
  return result;
}

std::unique_ptr<LocalInput> make_stdin_input() {
  return std::make_unique<FdInput>(STDIN_FILENO);
}

bool stdin_is_terminal() {
  return ::isatty(STDIN_FILENO) != 0;
}

bool stdout_is_terminal() {
  return ::isatty(STDOUT_FILENO) != 0;
}

bool TerminalModeGuard::activate(int target_fd) {
  fd = target_fd;
  if(!isatty(fd)) return false;
  if(tcgetattr(fd, &original) == -1) return false;
  termios raw = original;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if(tcsetattr(fd, TCSAFLUSH, &raw) == -1) return false;
  active = true;
  return true;
}

TerminalModeGuard::~TerminalModeGuard() {
  if(active) {
    tcsetattr(fd, TCSAFLUSH, &original);
  }
}

InputReader::InputReader(std::unique_ptr<LocalInput> input,
                         std::chrono::milliseconds poll_interval,
                         std::size_t chunk_size)
  : state_(std::make_shared<State>()) {
  state_->input = std::move(input);
  state_->poll_interval = poll_interval;
  state_->chunk_size = chunk_size == 0 ? 8192 : chunk_size;
}

InputReader::~InputReader() {
  stop();
  if(!thread_.joinable()) return;
  // the last owner may be released from a callback on the reader thread
  if(thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
  } else {
    thread_.join();
  }
}

void InputReader::start(DataHandler on_data, EndHandler on_end, StopPredicate should_stop) {
  if(!state_->input || state_->running.exchange(true)) return;
  state_->stop = false;
  thread_ = std::thread(&InputReader::run, state_, std::move(on_data), std::move(on_end),
                        std::move(should_stop));
}

void InputReader::stop() {
  state_->stop = true;
}

void InputReader::join() {
  if(thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void InputReader::run(std::shared_ptr<State> state,
                      DataHandler on_data,
                      EndHandler on_end,
                      StopPredicate should_stop) {
  std::vector<char> buffer(state->chunk_size);
  auto end_status = LocalInput::Status::timeout;
  while(!state->stop && !(should_stop && should_stop())) {
    auto result = state->input->read(buffer.data(), buffer.size(), state->poll_interval);
    if(result.status == LocalInput::Status::data) {
      if(on_data) on_data(std::string(buffer.data(), result.bytes));
      continue;
    }
    if(result.status == LocalInput::Status::eof || result.status == LocalInput::Status::error) {
      end_status = result.status;
      break;
    }
  }
  state->running = false;
  if(on_end) on_end(end_status);
}
