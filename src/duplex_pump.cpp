#include "duplex_pump.hpp"

#include "errors.hpp"
#include "local_io.hpp"
#include "log.hpp"

const char* finish_reason_name(DuplexPump::FinishReason reason) {
  switch(reason) {
    case DuplexPump::FinishReason::none:        return "running";
    case DuplexPump::FinishReason::local_eof:   return "local end of input";
    case DuplexPump::FinishReason::peer_closed: return "peer closed";
    case DuplexPump::FinishReason::read_error:  return "read error";
    case DuplexPump::FinishReason::stopped:     return "stopped";
  }
  return "unknown";
}

std::shared_ptr<DuplexPump> DuplexPump::create(std::shared_ptr<Session> session,
                                               std::shared_ptr<StopSignal> stop,
                                               Options options,
                                               std::shared_ptr<Logger> logger) {
  return std::shared_ptr<DuplexPump>(new DuplexPump(std::move(session),
                                                    std::move(stop),
                                                    options,
                                                    std::move(logger)));
}

DuplexPump::DuplexPump(std::shared_ptr<Session> session,
                       std::shared_ptr<StopSignal> stop,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : session_(std::move(session)),
    stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()),
    options_(options),
    logger_(std::move(logger)),
    read_buffer_(options.read_chunk == 0 ? 8192 : options.read_chunk),
    watchdog_(session_->io()) {
  if(options_.poll_interval.count() <= 0) {
    options_.poll_interval = std::chrono::milliseconds(200);
  }
}

DuplexPump::~DuplexPump() {
  if(reader_) reader_->stop();
}

void DuplexPump::set_inbound_handler(InboundHandler handler) {
  inbound_handler_ = std::move(handler);
}

void DuplexPump::set_local_input(std::unique_ptr<LocalInput> input) {
  pending_input_ = std::move(input);
}

void DuplexPump::set_input_filter(InputFilter filter) {
  input_filter_ = std::move(filter);
}

void DuplexPump::set_finished_handler(FinishedHandler handler) {
  finished_handler_ = std::move(handler);
}

void DuplexPump::start() {
  if(started_.exchange(true)) return;
  // reader_ is set before any io-thread callback can reach finish()
  start_local_input();
  auto self = shared_from_this();
  asio::dispatch(session_->io(), [this, self](){
    read_next();
    schedule_watchdog();
  });
}

void DuplexPump::read_next() {
  if(finished()) return;
  auto self = shared_from_this();
  session_->async_read_some(asio::buffer(read_buffer_),
    [this, self](std::error_code ec, std::size_t n, const asio::ip::udp::endpoint& from){
      if(finished()) return;
      if(ec) {
        if(is_disconnect(ec)) {
          log_debug(logger_.get(), "Peer {} closed: {}", session_->remote_endpoint(), ec.message());
          finish(FinishReason::peer_closed);
        } else {
          log_warn(logger_.get(), "Read from {} failed: {}", session_->remote_endpoint(), ec.message());
          finish(FinishReason::read_error);
        }
        return;
      }
      if(n == 0 && session_->protocol() == Protocol::tcp) {
        finish(FinishReason::peer_closed);
        return;
      }
      bytes_in_ += n;
      if(inbound_handler_) {
        inbound_handler_(std::string(read_buffer_.data(), n), from);
      }
      read_next();
    });
}

void DuplexPump::schedule_watchdog() {
  if(finished()) return;
  auto self = shared_from_this();
  watchdog_.expires_after(options_.poll_interval);
  watchdog_.async_wait([this, self](const std::error_code& ec){
    if(ec || finished()) return;
    if(stop_->raised()) {
      finish(FinishReason::stopped);
      return;
    }
    if(session_->is_closed()) {
      finish(FinishReason::peer_closed);
      return;
    }
    schedule_watchdog();
  });
}

void DuplexPump::start_local_input() {
  if(!pending_input_) return;
  reader_ = std::make_unique<InputReader>(std::move(pending_input_), options_.poll_interval);
  std::weak_ptr<DuplexPump> weak = shared_from_this();
  reader_->start(
    [weak](std::string chunk){
      auto self = weak.lock();
      if(!self || !self->wait_for_outbound(self->options_.max_in_flight)) return;
      if(self->input_filter_) {
        self->input_filter_(std::move(chunk));
      } else {
        self->send(std::move(chunk));
      }
    },
    [weak](LocalInput::Status status){
      auto self = weak.lock();
      if(!self) return;
      if(status == LocalInput::Status::eof || status == LocalInput::Status::error) {
        // end-of-stream only counts once every local byte reached the socket
        if(!self->wait_for_outbound(0)) return;
        self->on_local_end(status == LocalInput::Status::eof);
      }
    },
    [weak](){
      auto self = weak.lock();
      return !self || self->finished() || self->stop_->raised();
    });
}

void DuplexPump::on_local_end(bool eof) {
  if(!eof) {
    log_warn(logger_.get(), "Local input failed");
  }
  if(options_.keep_open) {
    log_debug(logger_.get(), "Local input ended, keeping session open");
    return;
  }
  log_debug(logger_.get(), "Local input ended, closing session");
  auto self = shared_from_this();
  // posted after every queued send, so the flush sees all local bytes
  session_->close_gracefully(options_.poll_interval);
  asio::post(session_->io(), [this, self](){
    finish(FinishReason::local_eof);
  });
}

// Called on the reader thread. False when the pump finished, a stop was
// requested or the session closed before the queue drained to `limit`.
bool DuplexPump::wait_for_outbound(std::size_t limit) {
  std::unique_lock<std::mutex> lock(flow_mutex_);
  while(in_flight_ > limit) {
    if(finished() || stop_->raised() || session_->is_closed()) return false;
    flow_cv_.wait_for(lock, options_.poll_interval);
  }
  return !finished();
}

std::size_t DuplexPump::in_flight() const {
  std::lock_guard<std::mutex> lock(flow_mutex_);
  return in_flight_;
}

void DuplexPump::send(std::string data, Session::WriteHandler handler) {
  auto size = data.size();
  bytes_out_ += size;
  {
    std::lock_guard<std::mutex> lock(flow_mutex_);
    in_flight_ += size;
  }
  auto self = shared_from_this();
  session_->send(std::move(data), [this, self, size, handler = std::move(handler)](std::error_code ec){
    {
      std::lock_guard<std::mutex> lock(flow_mutex_);
      in_flight_ -= size;
    }
    flow_cv_.notify_all();
    if(handler) handler(ec);
  });
}

void DuplexPump::stop() {
  auto self = shared_from_this();
  asio::dispatch(session_->io(), [this, self](){
    finish(FinishReason::stopped);
  });
}

void DuplexPump::finish(FinishReason reason) {
  if(finished_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(finish_mutex_);
    reason_ = reason;
  }
  watchdog_.cancel();
  if(reader_) reader_->stop();
  flow_cv_.notify_all();
  if(reason != FinishReason::local_eof) {
    session_->close();
  }
  log_debug(logger_.get(), "Pump for {} finished: {}", session_->remote_endpoint(), finish_reason_name(reason));
  finish_cv_.notify_all();
  if(finished_handler_) {
    auto handler = finished_handler_;
    handler(reason);
  }
}

DuplexPump::FinishReason DuplexPump::finish_reason() const {
  std::lock_guard<std::mutex> lock(finish_mutex_);
  return reason_;
}

bool DuplexPump::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(finish_mutex_);
  return finish_cv_.wait_for(lock, timeout, [this](){ return finished_.load(); });
}

void DuplexPump::wait() {
  std::unique_lock<std::mutex> lock(finish_mutex_);
  finish_cv_.wait(lock, [this](){ return finished_.load(); });
}
