#include "ndog_engine.hpp"

#include <fmt/format.h>

#include <csignal>
#include <filesystem>
#include <future>
#include <stdexcept>

#include <unistd.h>

#include "acceptor.hpp"
#include "chat_overlay.hpp"
#include "duplex_pump.hpp"
#include "errors.hpp"
#include "host_info.hpp"
#include "local_io.hpp"
#include "log.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "transfer_codec.hpp"
#include "udp_relay.hpp"

namespace {

uint16_t checked_port(int value) {
  if(value < 0 || value > 65535) {
    throw std::runtime_error("Invalid port '" + std::to_string(value) + "'");
  }
  return static_cast<uint16_t>(value);
}

} // namespace

EngineConfig load_engine_config(const SettingsManager& settings) {
  EngineConfig config;
  config.listen = settings.get<bool>("listen");
  config.host = settings.get<std::string>("host");
  config.port = checked_port(settings.get<int>("port"));
  config.protocol = settings.get<bool>("udp") ? Protocol::udp : Protocol::tcp;
  config.ssl = settings.get<bool>("ssl");
  config.tls.cert_file = settings.get<std::string>("cert");
  config.tls.key_file = settings.get<std::string>("key");
  config.tls.server_name = config.host;

  config.keep_open = settings.get<bool>("keep_open");
  config.chat = settings.get<bool>("chat");
  config.broadcast = settings.get<bool>("broadcast");
  config.verbose = settings.get<bool>("verbose");
  config.show_local_ip = settings.get<bool>("local_ip");
  config.show_public_ip = settings.get<bool>("public_ip");
  config.console.hex = settings.get<bool>("hex");
  config.console.color = settings.get<bool>("color");
  config.console.timestamps = settings.get<bool>("timestamp");

  config.send_file = settings.get<std::string>("send_file");
  config.receive_requested = settings.is_explicit("receive_file");
  config.receive_file = settings.get<std::string>("receive_file");
  config.message = settings.get<std::string>("message");
  config.output = settings.get<std::string>("output");

  config.connect_timeout = settings.get_seconds("wait");
  config.idle_timeout = settings.get_seconds("idle_timeout");
  config.poll_interval = settings.get_millis("poll_interval_ms");
  config.peer_idle_timeout = settings.get_seconds("peer_idle_timeout");
  config.peer_sweep_interval = settings.get_seconds("peer_sweep_interval");

  const bool file_mode = !config.send_file.empty() || config.receive_requested;
  if(!config.listen && config.host.empty()) {
    throw std::runtime_error("A host is required to connect (ndog <host> <port>)");
  }
  if(!config.listen && config.port == 0) {
    throw std::runtime_error("A port is required to connect (ndog <host> <port>)");
  }
  if(config.ssl && config.protocol == Protocol::udp) {
    throw std::runtime_error("--ssl is only available over TCP");
  }
  if(!config.send_file.empty() && config.receive_requested) {
    throw std::runtime_error("--send-file and --receive-file are mutually exclusive");
  }
  if(!config.message.empty() && (file_mode || config.listen)) {
    throw std::runtime_error("--message only applies to a client without file transfer");
  }
  if(config.chat && file_mode) {
    throw std::runtime_error("--chat cannot be combined with file transfer");
  }
  if(config.listen && config.protocol == Protocol::udp && !config.send_file.empty()) {
    throw std::runtime_error(std::error_code(NdogError::unsupported_mode).message() +
                             ": a UDP listener cannot send a file, run the sender as the client");
  }
  if(!config.send_file.empty() && !std::filesystem::is_regular_file(config.send_file)) {
    throw std::runtime_error("Cannot read file '" + config.send_file + "'");
  }
  return config;
}

NdogEngine::NdogEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(std::make_shared<Logger>("ndog")),
    stop_(std::make_shared<StopSignal>()) {}

NdogEngine::NdogEngine(std::shared_ptr<SettingsManager> settings)
  : NdogEngine(std::move(settings), Options{}) {}

NdogEngine::~NdogEngine() {
  stop_->raise();
  stop_io();
}

std::unique_ptr<LocalInput> NdogEngine::make_input() {
  if(options_.input_factory) return options_.input_factory();
  return make_stdin_input();
}

void NdogEngine::start_io() {
  work_.emplace(asio::make_work_guard(io_));
  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      log_debug(logger_.get(), "Signal {} received, shutting down", signo);
      stop_->raise();
      finish(0);
    });
  }
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void NdogEngine::stop_io() {
  if(!io_thread_.joinable()) return;
  // let queued closes run before the loop goes away
  auto drained = std::make_shared<std::promise<void>>();
  auto done = drained->get_future();
  asio::post(io_, [drained](){ drained->set_value(); });
  done.wait_for(config_.poll_interval * 2);
  work_.reset();
  io_.stop();
  io_thread_.join();
}

void NdogEngine::request_stop() {
  stop_->raise();
  finish(0);
}

void NdogEngine::finish(int exit_code) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(finished_) return;
    finished_ = true;
    exit_code_ = exit_code;
  }
  state_cv_.notify_all();
}

void NdogEngine::publish_port(uint16_t port) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    bound_port_ = port;
  }
  state_cv_.notify_all();
}

std::optional<uint16_t> NdogEngine::wait_for_port(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait_for(lock, timeout, [this](){ return bound_port_.has_value() || finished_; });
  return bound_port_;
}

int NdogEngine::run() {
  config_ = load_engine_config(*settings_);
  init(config_.verbose);
  if(!config_.output.empty()) {
    std::string error;
    if(!set_log_file(config_.output, error)) {
      throw std::runtime_error("Unable to open output file '" + config_.output + "': " + error);
    }
  }
  console_ = std::make_unique<Console>(config_.console, options_.console_writer);

  start_io();

  bool started = false;
  if(!config_.listen) {
    started = start_client();
  } else if(config_.protocol == Protocol::udp) {
    started = start_udp_listener();
  } else {
    started = start_tcp_listener();
  }
  if(!started) finish(1);

  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while(!finished_) {
      state_cv_.wait_for(lock, config_.poll_interval);
      if(stop_->raised()) {
        finished_ = true;
      }
    }
  }

  stop_->raise();
  if(listener_input_) listener_input_->stop();
  if(chat_) chat_->detach();
  // session_ and pump_ are assigned on the io thread
  auto released = std::make_shared<std::promise<void>>();
  auto done = released->get_future();
  asio::post(io_, [this, released](){
    if(pump_) pump_->stop();
    if(relay_) relay_->stop();
    if(acceptor_) acceptor_->stop();
    if(session_ && !pump_ && !relay_) session_->close();
    released->set_value();
  });
  done.wait_for(config_.poll_interval * 2);
  stop_io();
  if(listener_input_) listener_input_->join();

  console_->finish();
  close_log_file();
  terminal_.reset();

  std::lock_guard<std::mutex> lock(state_mutex_);
  return exit_code_;
}

void NdogEngine::show_inbound(const std::string& data, const std::string& from) {
  if(chat_) {
    chat_->show_inbound(data, from);
  } else {
    console_->payload(data, config_.console.hex ? from : std::string());
  }
}

void NdogEngine::report_transfer(const TransferResult& result, bool sending) {
  if(result.complete()) {
    if(sending) {
      console_->success(fmt::format("Sent {} ({} bytes)", result.header.name, result.bytes));
    } else {
      console_->success(fmt::format("Received {} ({} bytes)", result.path.string(), result.bytes));
    }
    return;
  }
  if(result.ec == NdogError::transfer_incomplete) {
    if(!result.header_received) {
      console_->warning("Incomplete transfer: no file header arrived");
    } else if(sending) {
      console_->warning(fmt::format("Incomplete transfer: sent {} of {} bytes",
                                    result.bytes, result.header.size));
    } else {
      console_->warning(fmt::format("Incomplete transfer: {} of {} bytes kept in {}",
                                    result.bytes, result.header.size, result.path.string()));
    }
    return;
  }
  console_->failure(fmt::format("Transfer failed: {}", result.ec.message()));
}

void NdogEngine::print_banner(uint16_t port) {
  std::string proto = protocol_name(config_.protocol);
  if(config_.ssl) proto += "+tls";
  console_->success(fmt::format("Listening on 0.0.0.0:{} ({})", port, proto));
  if(config_.show_local_ip) {
    asio::io_context lookup_io;
    console_->status("Local IP: " + get_local_ip(lookup_io, logger_.get()));
  }
  if(config_.show_public_ip) {
    asio::io_context lookup_io;
    console_->status("Public IP: " + get_public_ip(lookup_io, config_.connect_timeout, logger_.get()));
  }
}

void NdogEngine::start_chat(std::function<void(std::string)> send,
                            std::function<std::string()> status,
                            std::function<std::string()> whoami) {
  bool raw = false;
  if(!options_.input_factory) {
    terminal_ = std::make_unique<TerminalModeGuard>();
    raw = terminal_->activate(STDIN_FILENO);
  }
  ChatOverlay::Hooks hooks;
  hooks.send = std::move(send);
  hooks.status = std::move(status);
  hooks.whoami = std::move(whoami);
  hooks.quit = [this](){
    stop_->raise();
    finish(0);
  };
  chat_ = std::make_unique<ChatOverlay>(*console_, std::move(hooks), raw);
  chat_->show_notice("Chat mode, /help lists commands");
  chat_->attach();
}

void NdogEngine::start_listener_input(std::function<void(std::string)> sink) {
  listener_input_ = std::make_unique<InputReader>(make_input(), config_.poll_interval);
  listener_input_->start(
    [sink = std::move(sink)](std::string chunk){
      sink(std::move(chunk));
    },
    [this](LocalInput::Status status){
      if(status == LocalInput::Status::timeout) return;
      log_debug(logger_.get(), "Local input ended, listener keeps serving");
    },
    [this](){ return stop_->raised(); });
}

// ---- client -----------------------------------------------------------------

bool NdogEngine::start_client() {
  Session::ConnectOptions connect;
  connect.host = config_.host;
  connect.port = config_.port;
  connect.protocol = config_.protocol;
  connect.timeout = config_.connect_timeout;
  connect.server_name = config_.tls.server_name;
  if(config_.ssl) {
    std::error_code ec;
    connect.tls = make_client_tls_context(config_.tls, ec, logger_.get());
    if(!connect.tls) {
      console_->failure(fmt::format("TLS setup failed: {}", ec.message()));
      return false;
    }
  }

  Session::async_connect(io_, connect,
    [this](std::error_code ec, std::shared_ptr<Session> session){
      if(stop_->raised()) {
        if(session) session->close();
        return;
      }
      if(ec) {
        console_->failure(fmt::format("Unable to connect to {}:{}: {}",
                                      config_.host, config_.port, ec.message()));
        finish(1);
        return;
      }
      on_client_connected(std::move(session));
    },
    logger_);
  return true;
}

void NdogEngine::on_client_connected(std::shared_ptr<Session> session) {
  session_ = session;
  std::string proto = protocol_name(session->protocol());
  if(session->tls_enabled()) proto += "+tls";
  console_->success(fmt::format("Connected to {} ({})", session->remote_endpoint(), proto));

  TransferOptions transfer;
  transfer.idle_timeout = config_.idle_timeout;
  transfer.poll_interval = config_.poll_interval;
  transfer.stop = stop_;

  if(!config_.send_file.empty()) {
    async_send_file(session, config_.send_file, transfer,
      [this, session](const TransferResult& result){
        report_transfer(result, true);
        session->close_gracefully(config_.poll_interval);
        finish(0);
      },
      logger_);
    return;
  }
  if(config_.receive_requested) {
    async_receive_file(session, config_.receive_file, transfer,
      [this, session](const TransferResult& result){
        report_transfer(result, false);
        session->close();
        finish(0);
      },
      logger_);
    return;
  }
  start_client_pump(std::move(session));
}

void NdogEngine::start_client_pump(std::shared_ptr<Session> session) {
  DuplexPump::Options pump_options;
  pump_options.poll_interval = config_.poll_interval;
  pump_options.keep_open = config_.keep_open;
  auto pump = DuplexPump::create(session, stop_, pump_options, logger_);

  pump->set_inbound_handler([this](const std::string& data, const asio::ip::udp::endpoint&){
    show_inbound(data, std::string());
  });
  pump->set_finished_handler([this](DuplexPump::FinishReason reason){
    if(reason == DuplexPump::FinishReason::peer_closed) {
      console_->status("Connection closed by peer");
    }
    finish(0);
  });

  if(!config_.message.empty()) {
    pump->set_local_input(std::make_unique<BufferInput>(config_.message + "\n"));
  } else {
    pump->set_local_input(make_input());
  }

  if(config_.chat) {
    std::weak_ptr<DuplexPump> weak = pump;
    start_chat(
      [weak](std::string line){
        if(auto p = weak.lock()) p->send(std::move(line));
      },
      [weak](){
        auto p = weak.lock();
        if(!p) return std::string("no session");
        auto s = p->session();
        return fmt::format("{} {} -> {} ({}{}), {} bytes in, {} bytes out",
                           session_state_name(s->state()),
                           s->local_endpoint(), s->remote_endpoint(),
                           protocol_name(s->protocol()), s->tls_enabled() ? "+tls" : "",
                           p->bytes_in(), p->bytes_out());
      },
      [session](){ return session->local_endpoint(); });
    pump->set_input_filter([this](std::string chunk){
      chat_->feed(chunk);
    });
  }

  pump_ = pump;
  pump->start();
}

// ---- listeners --------------------------------------------------------------

bool NdogEngine::start_tcp_listener() {
  Acceptor::Options acceptor_options;
  if(!config_.send_file.empty()) {
    acceptor_options.mode = Acceptor::Mode::send_file;
    acceptor_options.file = config_.send_file;
  } else if(config_.receive_requested) {
    acceptor_options.mode = Acceptor::Mode::receive_file;
    acceptor_options.file = config_.receive_file;
  }
  acceptor_options.broadcast = config_.broadcast;
  acceptor_options.keep_open = config_.keep_open;
  acceptor_options.poll_interval = config_.poll_interval;
  acceptor_options.timeouts.connect = config_.connect_timeout;
  acceptor_options.timeouts.accept_poll = config_.poll_interval;
  acceptor_options.timeouts.idle_read = config_.idle_timeout;
  acceptor_options.timeouts.handshake = config_.connect_timeout;

  if(config_.ssl) {
    std::error_code ec;
    acceptor_options.tls = make_server_tls_context(config_.tls, ec, logger_.get());
    if(!acceptor_options.tls) {
      console_->failure(fmt::format("TLS setup failed: {}", ec.message()));
      return false;
    }
  }

  std::error_code ec;
  auto acceptor = Acceptor::listen(io_, config_.port, acceptor_options, stop_, ec, logger_);
  if(!acceptor) {
    console_->failure(fmt::format("Unable to listen on port {}: {}", config_.port, ec.message()));
    return false;
  }
  const auto mode = acceptor_options.mode;

  acceptor->set_inbound_handler([this](const std::string& data, const std::string& from){
    show_inbound(data, from);
  });
  acceptor->set_client_event_handler([this](const std::string& remote, bool connected){
    auto text = fmt::format("{} {}", remote, connected ? "connected" : "disconnected");
    if(chat_) {
      chat_->show_notice(text);
    } else {
      console_->status(text);
    }
  });
  acceptor->set_transfer_handler([this, mode](const TransferResult& result){
    report_transfer(result, mode == Acceptor::Mode::send_file);
  });

  acceptor_ = acceptor;
  print_banner(acceptor->port());
  publish_port(acceptor->port());
  acceptor->start();

  if(mode != Acceptor::Mode::duplex) return true;

  std::weak_ptr<Acceptor> weak = acceptor;
  auto send = [weak](std::string data){
    if(auto a = weak.lock()) a->broadcast(data);
  };
  if(config_.chat) {
    start_chat(send,
      [weak](){
        auto a = weak.lock();
        if(!a) return std::string("listener stopped");
        return fmt::format("listening on port {}, {} client(s), {} accepted",
                           a->port(), a->client_count(), a->accepted_count());
      },
      [weak](){
        auto a = weak.lock();
        return fmt::format("0.0.0.0:{}", a ? a->port() : 0);
      });
    start_listener_input([this](std::string chunk){ chat_->feed(chunk); });
  } else {
    start_listener_input(send);
  }
  return true;
}

void NdogEngine::receive_udp_file(std::shared_ptr<Session> session) {
  TransferOptions transfer;
  transfer.idle_timeout = config_.idle_timeout;
  transfer.poll_interval = config_.poll_interval;
  transfer.idle_before_header = false;
  transfer.stop = stop_;
  async_receive_file(session, config_.receive_file, transfer,
    [this, session](const TransferResult& result){
      report_transfer(result, false);
      if(config_.keep_open && !stop_->raised() && !session->is_closed()) {
        receive_udp_file(session);
        return;
      }
      finish(0);
    },
    logger_);
}

bool NdogEngine::start_udp_listener() {
  std::error_code ec;
  auto session = Session::listen_udp(io_, config_.port, ec, logger_);
  if(!session) {
    console_->failure(fmt::format("Unable to listen on UDP port {}: {}", config_.port, ec.message()));
    return false;
  }
  session_ = session;
  print_banner(session->local_port());
  publish_port(session->local_port());

  if(config_.receive_requested) {
    receive_udp_file(session);
    return true;
  }

  UdpRelay::Options relay_options;
  relay_options.poll_interval = config_.poll_interval;
  relay_options.peer_idle_timeout = config_.peer_idle_timeout;
  relay_options.sweep_interval = config_.peer_sweep_interval;
  relay_options.relay = config_.broadcast;
  relay_options.keep_open = true;
  auto relay = UdpRelay::create(session, stop_, relay_options, logger_);

  relay->set_inbound_handler([this](const std::string& data, const std::string& from){
    show_inbound(data, from);
  });
  relay->set_peer_event_handler([this](const std::string& peer, bool joined){
    if(chat_) chat_->show_notice(fmt::format("{} {}", peer, joined ? "joined" : "timed out"));
  });

  if(config_.chat) {
    std::weak_ptr<UdpRelay> weak = relay;
    start_chat(
      [weak](std::string line){
        if(auto r = weak.lock()) r->broadcast(line);
      },
      [weak](){
        auto r = weak.lock();
        if(!r) return std::string("listener stopped");
        return fmt::format("udp listener {}, {} peer(s)",
                           r->session()->local_endpoint(), r->peers().size());
      },
      [session](){ return session->local_endpoint(); });
    relay->set_input_filter([this](std::string chunk){ chat_->feed(chunk); });
  }
  relay->set_local_input(make_input());

  relay_ = relay;
  relay->start();
  return true;
}
