#include "acceptor.hpp"

#include "duplex_pump.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "session.hpp"

#include <algorithm>

using asio::ip::tcp;

namespace {

void track(std::vector<std::weak_ptr<Session>>& sessions, const std::shared_ptr<Session>& session){
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [](const std::weak_ptr<Session>& s){ return s.expired(); }),
                   sessions.end());
    sessions.push_back(session);
}

void untrack(std::vector<std::weak_ptr<Session>>& sessions, const std::shared_ptr<Session>& session){
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [&](const std::weak_ptr<Session>& s){
                                      auto live = s.lock();
                                      return !live || live == session;
                                  }),
                   sessions.end());
}

void close_all(std::vector<std::weak_ptr<Session>>& sessions){
    for(auto& weak : sessions) {
        if(auto session = weak.lock()) session->close();
    }
    sessions.clear();
}

} // namespace

std::shared_ptr<Acceptor> Acceptor::listen(asio::io_context& io,
                                           uint16_t port,
                                           Options options,
                                           std::shared_ptr<StopSignal> stop,
                                           std::error_code& ec,
                                           std::shared_ptr<Logger> logger)
{
    ec.clear();
    auto acceptor = std::shared_ptr<Acceptor>(new Acceptor(io, std::move(options), std::move(stop), logger));
    tcp::endpoint endpoint(tcp::v4(), port);
    std::error_code op;
    acceptor->acceptor_.open(endpoint.protocol(), op);
    if(!op) acceptor->acceptor_.set_option(tcp::acceptor::reuse_address(true), op);
    if(!op) acceptor->acceptor_.bind(endpoint, op);
    if(!op) acceptor->acceptor_.listen(asio::socket_base::max_listen_connections, op);
    if(op) {
        log_error(logger.get(), "Unable to listen on TCP port {}: {}", port, op.message());
        ec = NdogError::bind_failed;
        return nullptr;
    }
    auto local = acceptor->acceptor_.local_endpoint(op);
    acceptor->port_ = op ? port : local.port();
    return acceptor;
}

Acceptor::Acceptor(asio::io_context& io,
                   Options options,
                   std::shared_ptr<StopSignal> stop,
                   std::shared_ptr<Logger> logger)
: io_(io),
  options_(std::move(options)),
  stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()),
  logger_(std::move(logger)),
  acceptor_(io),
  watchdog_(io),
  retry_timer_(io)
{
    if(options_.poll_interval.count() <= 0) {
        options_.poll_interval = std::chrono::milliseconds(200);
    }
}

void Acceptor::set_inbound_handler(InboundHandler handler){ inbound_handler_ = std::move(handler); }
void Acceptor::set_client_event_handler(ClientEventHandler handler){ client_event_handler_ = std::move(handler); }
void Acceptor::set_transfer_handler(TransferDoneHandler handler){ transfer_handler_ = std::move(handler); }

void Acceptor::start(){
    if(started_.exchange(true)) return;
    auto self = shared_from_this();
    asio::dispatch(io_, [this, self](){
        do_accept();
        schedule_watchdog();
    });
}

void Acceptor::do_accept(){
    if(stopping_) return;
    auto self = shared_from_this();
    acceptor_.async_accept(
        [this, self](std::error_code ec, tcp::socket socket){
            if(stopping_) {
                std::error_code ignored;
                socket.close(ignored);
                return;
            }
            if(ec) {
                if(ec == asio::error::operation_aborted) return;
                // EMFILE and friends clear up on their own; try again shortly
                log_warn(logger_.get(), "Accept failed: {}", ec.message());
                retry_timer_.expires_after(options_.poll_interval);
                retry_timer_.async_wait([this, self](const std::error_code& wait_ec){
                    if(!wait_ec) do_accept();
                });
                return;
            }
            on_accepted(std::move(socket));
            do_accept();
        });
}

void Acceptor::schedule_watchdog(){
    auto self = shared_from_this();
    watchdog_.expires_after(options_.poll_interval);
    watchdog_.async_wait([this, self](const std::error_code& ec){
        if(ec || stopping_) return;
        if(stop_->raised()) {
            do_stop();
            return;
        }
        schedule_watchdog();
    });
}

void Acceptor::on_accepted(tcp::socket socket){
    ++accepted_;
    auto session = Session::accepted(io_, std::move(socket), logger_);
    log_info(logger_.get(), "Connection from {}", session->remote_endpoint());

    if(!options_.tls) {
        serve(session);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        track(handshakes_, session);
    }
    auto self = shared_from_this();
    session->async_server_handshake(options_.tls, options_.timeouts.handshake,
        [this, self, session](std::error_code ec){
            {
                std::lock_guard<std::mutex> lock(tracked_mutex_);
                untrack(handshakes_, session);
            }
            if(ec) {
                if(stopping_) {
                    log_debug(logger_.get(), "Handshake with {} abandoned on shutdown", session->remote_endpoint());
                } else {
                    log_warn(logger_.get(), "Rejected {}: {}", session->remote_endpoint(), ec.message());
                }
                return;
            }
            if(stopping_) {
                session->close();
                return;
            }
            serve(session);
        });
}

void Acceptor::serve(std::shared_ptr<Session> session){
    if(options_.mode == Mode::duplex) {
        serve_duplex(std::move(session));
    } else {
        serve_transfer(std::move(session));
    }
}

void Acceptor::serve_duplex(std::shared_ptr<Session> session){
    DuplexPump::Options pump_options;
    pump_options.poll_interval = options_.poll_interval;
    pump_options.keep_open = true;
    auto pump = DuplexPump::create(session, stop_, pump_options, logger_);
    auto remote = session->remote_endpoint();
    auto id = clients_.add(pump, remote);

    std::weak_ptr<Acceptor> weak = shared_from_this();
    pump->set_inbound_handler([weak, id, remote](const std::string& data, const asio::ip::udp::endpoint&){
        auto self = weak.lock();
        if(!self) return;
        if(self->inbound_handler_) self->inbound_handler_(data, remote);
        if(self->options_.broadcast) self->relay(id, data);
    });
    pump->set_finished_handler([weak, id, remote](DuplexPump::FinishReason reason){
        auto self = weak.lock();
        if(!self) return;
        if(self->clients_.remove(id)) {
            log_info(self->logger_.get(), "{} disconnected ({})", remote, finish_reason_name(reason));
            if(self->client_event_handler_) self->client_event_handler_(remote, false);
        }
    });
    if(client_event_handler_) client_event_handler_(remote, true);
    pump->start();
}

void Acceptor::serve_transfer(std::shared_ptr<Session> session){
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        track(transfers_, session);
    }

    TransferOptions transfer_options;
    transfer_options.idle_timeout = options_.timeouts.idle_read;
    transfer_options.poll_interval = options_.poll_interval;
    transfer_options.stop = stop_;

    auto self = shared_from_this();
    auto on_done = [this, self, session](const TransferResult& result){
        if(options_.mode == Mode::send_file) {
            session->close_gracefully(options_.poll_interval);
        } else {
            session->close();
        }
        if(transfer_handler_) transfer_handler_(result);
        if(!options_.keep_open) {
            log_debug(logger_.get(), "Single exchange finished, stopping listener");
            stop_->raise();
        }
    };

    if(options_.mode == Mode::send_file) {
        async_send_file(session, options_.file, transfer_options, std::move(on_done), logger_);
    } else {
        async_receive_file(session, options_.file, transfer_options, std::move(on_done), logger_);
    }
}

void Acceptor::relay(uint64_t from_id, const std::string& data){
    for(const auto& client : clients_.snapshot()) {
        if(client.id == from_id) continue;
        auto remote = client.remote;
        auto logger = logger_;
        client.pump->send(data, [remote, logger](std::error_code ec){
            if(ec) {
                std::error_code relay_ec = NdogError::peer_send_failed;
                log_debug(logger.get(), "Relay to {}: {} ({})", remote, relay_ec.message(), ec.message());
            }
        });
    }
}

void Acceptor::broadcast(const std::string& data){
    for(const auto& client : clients_.snapshot()) {
        auto remote = client.remote;
        auto logger = logger_;
        client.pump->send(data, [remote, logger](std::error_code ec){
            if(ec) log_debug(logger.get(), "Send to {} failed: {}", remote, ec.message());
        });
    }
}

std::size_t Acceptor::pending_handshakes() const{
    std::lock_guard<std::mutex> lock(tracked_mutex_);
    return std::count_if(handshakes_.begin(), handshakes_.end(),
                         [](const std::weak_ptr<Session>& s){ return !s.expired(); });
}

void Acceptor::stop(){
    auto self = shared_from_this();
    asio::dispatch(io_, [this, self](){
        do_stop();
    });
}

void Acceptor::do_stop(){
    if(stopping_.exchange(true)) return;
    std::error_code ignored;
    watchdog_.cancel();
    retry_timer_.cancel();
    acceptor_.cancel(ignored);

    auto clients = clients_.take_all();
    for(auto& client : clients) {
        client.pump->stop();
        client.pump->session()->close();
    }
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        close_all(handshakes_);
        close_all(transfers_);
    }
    acceptor_.close(ignored);
    log_info(logger_.get(), "Listener on port {} stopped ({} client(s) closed)", port_, clients.size());
}
