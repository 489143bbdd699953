#include "udp_relay.hpp"

#include "errors.hpp"
#include "local_io.hpp"
#include "log.hpp"
#include "session.hpp"
#include "utils.hpp"

std::shared_ptr<UdpRelay> UdpRelay::create(std::shared_ptr<Session> session,
                                           std::shared_ptr<StopSignal> stop,
                                           Options options,
                                           std::shared_ptr<Logger> logger) {
  return std::shared_ptr<UdpRelay>(new UdpRelay(std::move(session), std::move(stop),
                                                options, std::move(logger)));
}

UdpRelay::UdpRelay(std::shared_ptr<Session> session,
                   std::shared_ptr<StopSignal> stop,
                   Options options,
                   std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(std::move(logger)),
    sweep_timer_(session->io()) {
  DuplexPump::Options pump_options;
  pump_options.poll_interval = options_.poll_interval;
  pump_options.keep_open = options_.keep_open;
  pump_ = DuplexPump::create(std::move(session), std::move(stop), pump_options, logger_);
}

void UdpRelay::set_inbound_handler(InboundHandler handler) {
  inbound_handler_ = std::move(handler);
}

void UdpRelay::set_peer_event_handler(PeerEventHandler handler) {
  peer_event_handler_ = std::move(handler);
}

void UdpRelay::set_local_input(std::unique_ptr<LocalInput> input) {
  pump_->set_local_input(std::move(input));
}

void UdpRelay::set_input_filter(DuplexPump::InputFilter filter) {
  custom_filter_ = static_cast<bool>(filter);
  pump_->set_input_filter(std::move(filter));
}

void UdpRelay::start() {
  std::weak_ptr<UdpRelay> weak = shared_from_this();
  pump_->set_inbound_handler([weak](const std::string& data, const asio::ip::udp::endpoint& from){
    if(auto self = weak.lock()) self->on_datagram(data, from);
  });
  // a listener has no single target; local input goes to every peer
  if(!custom_filter_) {
    pump_->set_input_filter([weak](std::string chunk){
      if(auto self = weak.lock()) self->broadcast(chunk);
    });
  }
  pump_->set_finished_handler([weak](DuplexPump::FinishReason){
    if(auto self = weak.lock()) {
      self->sweep_timer_.cancel();
      self->peers_.clear();
    }
  });
  pump_->start();
  auto self = shared_from_this();
  asio::dispatch(pump_->session()->io(), [self](){
    self->schedule_sweep();
  });
}

void UdpRelay::on_datagram(const std::string& data, const asio::ip::udp::endpoint& from) {
  bool known = peers_.contains(from);
  auto others = peers_.on_receive(from);
  auto sender = format_endpoint(from);
  if(!known) {
    log_info(logger_.get(), "New UDP peer {}", sender);
    if(peer_event_handler_) peer_event_handler_(sender, true);
  }
  // empty datagrams only announce a peer
  if(data.empty()) return;

  if(inbound_handler_) inbound_handler_(data, sender);
  if(!options_.relay) return;
  auto session = pump_->session();
  for(const auto& peer : others) {
    auto logger = logger_;
    session->send_to(data, peer, [logger, peer](std::error_code ec){
      if(ec) {
        std::error_code relay_ec = NdogError::peer_send_failed;
        log_debug(logger.get(), "Relay to {}: {} ({})", format_endpoint(peer), relay_ec.message(), ec.message());
      }
    });
  }
}

void UdpRelay::broadcast(const std::string& data) {
  auto session = pump_->session();
  for(const auto& peer : peers_.snapshot()) {
    auto logger = logger_;
    session->send_to(data, peer, [logger, peer](std::error_code ec){
      if(ec) log_debug(logger.get(), "Send to {} failed: {}", format_endpoint(peer), ec.message());
    });
  }
}

void UdpRelay::schedule_sweep() {
  if(pump_->finished()) return;
  auto self = shared_from_this();
  sweep_timer_.expires_after(options_.sweep_interval);
  sweep_timer_.async_wait([this, self](const std::error_code& ec){
    if(ec || pump_->finished()) return;
    auto evicted = peers_.sweep(PeerRegistry::Clock::now(), options_.peer_idle_timeout);
    for(const auto& peer : evicted) {
      auto name = format_endpoint(peer);
      log_info(logger_.get(), "UDP peer {} idle for more than {} s, forgetting it",
               name, std::chrono::duration_cast<std::chrono::seconds>(options_.peer_idle_timeout).count());
      if(peer_event_handler_) peer_event_handler_(name, false);
    }
    schedule_sweep();
  });
}

void UdpRelay::stop() {
  pump_->stop();
}
