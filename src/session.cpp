#include "session.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <openssl/ssl.h>

using asio::ip::tcp;
using asio::ip::udp;

const char* session_state_name(Session::State state) {
  switch(state) {
    case Session::State::Idle:       return "idle";
    case Session::State::Connecting: return "connecting";
    case Session::State::Connected:  return "connected";
    case Session::State::Closing:    return "closing";
    case Session::State::Closed:     return "closed";
  }
  return "unknown";
}

Session::Session(asio::io_context& io, Role role, std::shared_ptr<Logger> logger)
: io_(io), role_(role), logger_(std::move(logger)), deadline_timer_(io)
{
}

Session::~Session(){
    std::error_code ignored;
    if(tls_) tls_->lowest_layer().close(ignored);
    if(tcp_) tcp_->close(ignored);
    if(udp_) udp_->close(ignored);
}

void Session::async_connect(asio::io_context& io,
                            ConnectOptions options,
                            ConnectHandler handler,
                            std::shared_ptr<Logger> logger)
{
    auto session = std::shared_ptr<Session>(new Session(io, Role::Client, std::move(logger)));
    asio::dispatch(io, [session, options = std::move(options), handler = std::move(handler)]() mutable {
        session->start_connect(std::move(options), std::move(handler));
    });
}

std::shared_ptr<Session> Session::accepted(asio::io_context& io,
                                           tcp::socket socket,
                                           std::shared_ptr<Logger> logger)
{
    auto session = std::shared_ptr<Session>(new Session(io, Role::Server, std::move(logger)));
    session->tcp_.emplace(std::move(socket));
    session->transport_ = TcpTransport{};
    session->record_endpoints();
    session->state_ = State::Connected;
    return session;
}

std::shared_ptr<Session> Session::listen_udp(asio::io_context& io,
                                             uint16_t port,
                                             std::error_code& ec,
                                             std::shared_ptr<Logger> logger)
{
    ec.clear();
    auto session = std::shared_ptr<Session>(new Session(io, Role::Server, logger));
    udp::socket socket(io);
    udp::endpoint endpoint(udp::v4(), port);
    std::error_code op;
    socket.open(endpoint.protocol(), op);
    if(!op) socket.set_option(udp::socket::reuse_address(true), op);
    if(!op) socket.bind(endpoint, op);
    if(op) {
        log_error(logger.get(), "Unable to bind UDP port {}: {}", port, op.message());
        ec = NdogError::bind_failed;
        return nullptr;
    }
    session->udp_.emplace(std::move(socket));
    session->transport_ = UdpTransport{};
    session->record_endpoints();
    session->state_ = State::Connected;
    return session;
}

void Session::start_connect(ConnectOptions options, ConnectHandler handler){
    connect_options_ = std::move(options);
    connect_handler_ = std::move(handler);
    state_ = State::Connecting;
    auto self = shared_from_this();
    const auto port = std::to_string(connect_options_.port);

    log_debug(logger_.get(), "Connecting to {}:{} ({}{})",
              connect_options_.host, connect_options_.port,
              protocol_name(connect_options_.protocol),
              connect_options_.tls ? "+tls" : "");

    if(connect_options_.protocol == Protocol::udp) {
        udp_resolver_ = std::make_unique<udp::resolver>(io_);
        udp_resolver_->async_resolve(connect_options_.host, port,
            [this, self](std::error_code ec, udp::resolver::results_type results){
                if(ec) {
                    log_debug(logger_.get(), "Resolve failed for {}: {}", connect_options_.host, ec.message());
                    finish_connect(NdogError::resolve_failed);
                    return;
                }
                connect_udp(results);
            });
        return;
    }

    deadline_timer_.expires_after(connect_options_.timeout);
    deadline_timer_.async_wait([this, self](const std::error_code& ec){
        if(ec || state() != State::Connecting) return;
        deadline_expired_ = true;
        if(tcp_resolver_) tcp_resolver_->cancel();
        std::error_code ignored;
        tcp_layer().close(ignored);
    });

    tcp_.emplace(io_);
    tcp_resolver_ = std::make_unique<tcp::resolver>(io_);
    tcp_resolver_->async_resolve(connect_options_.host, port,
        [this, self](std::error_code ec, tcp::resolver::results_type results){
            if(deadline_expired_) {
                finish_connect(NdogError::connect_timeout);
                return;
            }
            if(ec) {
                log_debug(logger_.get(), "Resolve failed for {}: {}", connect_options_.host, ec.message());
                finish_connect(NdogError::resolve_failed);
                return;
            }
            connect_tcp(results);
        });
}

void Session::connect_tcp(const tcp::resolver::results_type& results){
    auto self = shared_from_this();
    asio::async_connect(*tcp_, results,
        [this, self](std::error_code ec, const tcp::endpoint& ep){
            if(deadline_expired_) {
                finish_connect(NdogError::connect_timeout);
                return;
            }
            if(ec) {
                log_debug(logger_.get(), "Connect failed: {}", ec.message());
                if(ec == asio::error::connection_refused) {
                    finish_connect(NdogError::connect_refused);
                } else if(ec == asio::error::timed_out) {
                    finish_connect(NdogError::connect_timeout);
                } else {
                    finish_connect(ec);
                }
                return;
            }
            log_debug(logger_.get(), "TCP connected to {}", format_endpoint(ep));
            if(connect_options_.tls) {
                start_client_handshake();
            } else {
                record_endpoints();
                finish_connect({});
            }
        });
}

void Session::start_client_handshake(){
    auto self = shared_from_this();
    tls_context_ = connect_options_.tls;
    tls_ = std::make_unique<TlsStream>(std::move(*tcp_), *tls_context_);
    tcp_.reset();
    tls_enabled_ = true;

    const auto& sni = connect_options_.server_name.empty() ? connect_options_.host
                                                           : connect_options_.server_name;
    if(!sni.empty()) {
        SSL_set_tlsext_host_name(tls_->native_handle(), sni.c_str());
    }

    tls_->async_handshake(asio::ssl::stream_base::client,
        [this, self](std::error_code ec){
            if(ec) {
                log_debug(logger_.get(), "TLS handshake failed: {}", ec.message());
                finish_connect(NdogError::tls_handshake_failed);
                return;
            }
            record_endpoints();
            finish_connect({});
        });
}

void Session::connect_udp(const udp::resolver::results_type& results){
    if(results.empty()) {
        finish_connect(NdogError::resolve_failed);
        return;
    }
    udp::endpoint target = *results.begin();
    udp::socket socket(io_);
    std::error_code ec;
    socket.open(target.protocol(), ec);
    if(!ec) socket.bind(udp::endpoint(target.protocol(), 0), ec);
    if(ec) {
        log_debug(logger_.get(), "UDP bind failed: {}", ec.message());
        finish_connect(NdogError::bind_failed);
        return;
    }
    udp_.emplace(std::move(socket));
    transport_ = UdpTransport{target};
    record_endpoints();
    finish_connect({});
    if(connect_options_.udp_announce && is_connected()) {
        send(std::string());
    }
}

void Session::finish_connect(std::error_code ec){
    deadline_timer_.cancel();
    tcp_resolver_.reset();
    udp_resolver_.reset();

    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;

    if(ec) {
        log_debug(logger_.get(), "Connect to {}:{} failed: {}",
                  connect_options_.host, connect_options_.port, ec.message());
        state_ = State::Closing;
        do_close();
    } else {
        auto expected = State::Connecting;
        if(!state_.compare_exchange_strong(expected, State::Connected)) {
            // closed while connecting
            ec = asio::error::operation_aborted;
        } else {
            log_debug(logger_.get(), "Session connected {} -> {}", local_, remote_);
        }
    }
    if(handler) handler(ec, shared_from_this());
}

void Session::async_server_handshake(std::shared_ptr<asio::ssl::context> ctx,
                                     std::chrono::milliseconds timeout,
                                     HandshakeHandler handler)
{
    auto self = shared_from_this();
    asio::dispatch(io_, [this, self, ctx = std::move(ctx), timeout, handler = std::move(handler)]() mutable {
        auto expected = State::Connected;
        if(!tcp_ || !state_.compare_exchange_strong(expected, State::Connecting)) {
            if(handler) handler(NdogError::not_connected);
            return;
        }
        tls_context_ = std::move(ctx);
        tls_ = std::make_unique<TlsStream>(std::move(*tcp_), *tls_context_);
        tcp_.reset();
        tls_enabled_ = true;

        deadline_timer_.expires_after(timeout);
        deadline_timer_.async_wait([this, self](const std::error_code& ec){
            if(ec || state() != State::Connecting) return;
            deadline_expired_ = true;
            std::error_code ignored;
            tls_->lowest_layer().close(ignored);
        });

        tls_->async_handshake(asio::ssl::stream_base::server,
            [this, self, handler = std::move(handler)](std::error_code ec){
                deadline_timer_.cancel();
                if(ec) {
                    log_debug(logger_.get(), "TLS handshake with {} failed: {}",
                              remote_, deadline_expired_ ? "timed out" : ec.message());
                    state_ = State::Closing;
                    do_close();
                    if(handler) handler(NdogError::tls_handshake_failed);
                    return;
                }
                auto expected = State::Connecting;
                if(!state_.compare_exchange_strong(expected, State::Connected)) {
                    if(handler) handler(asio::error::operation_aborted);
                    return;
                }
                if(handler) handler({});
            });
    });
}

void Session::async_read_some(asio::mutable_buffer buffer, ReadHandler handler){
    auto self = shared_from_this();
    asio::dispatch(io_, [this, self, buffer, handler = std::move(handler)]() mutable {
        do_read(buffer, std::move(handler));
    });
}

void Session::do_read(asio::mutable_buffer buffer, ReadHandler handler){
    auto self = shared_from_this();
    if(state() != State::Connected && state() != State::Closing) {
        asio::post(io_, [handler = std::move(handler)](){
            handler(asio::error::bad_descriptor, 0, udp::endpoint());
        });
        return;
    }
    if(udp_) {
        udp_->async_receive_from(buffer, sender_,
            [this, self, handler = std::move(handler)](std::error_code ec, std::size_t n){
                handler(ec, n, sender_);
            });
        return;
    }
    auto on_read = [this, self, handler = std::move(handler)](std::error_code ec, std::size_t n){
        handler(ec, n, sender_);
    };
    if(tls_) {
        tls_->async_read_some(buffer, std::move(on_read));
    } else {
        tcp_->async_read_some(buffer, std::move(on_read));
    }
}

void Session::send(std::string data, WriteHandler handler){
    enqueue(PendingWrite{std::move(data), std::nullopt, std::move(handler)});
}

void Session::send_to(std::string data, const udp::endpoint& to, WriteHandler handler){
    enqueue(PendingWrite{std::move(data), to, std::move(handler)});
}

void Session::enqueue(PendingWrite write){
    auto self = shared_from_this();
    asio::post(io_, [this, self, write = std::move(write)]() mutable {
        if(state() != State::Connected) {
            if(write.handler) write.handler(NdogError::not_connected);
            return;
        }
        if(udp_ && !write.to) {
            const auto* udp = std::get_if<UdpTransport>(&transport_);
            if(!udp || udp->target.port() == 0) {
                if(write.handler) write.handler(NdogError::not_connected);
                return;
            }
            write.to = udp->target;
        }
        bool start_write = write_queue_.empty();
        write_queue_.push_back(std::move(write));
        if(start_write) {
            do_write();
        }
    });
}

void Session::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    auto& front = write_queue_.front();
    auto on_written = [this, self](std::error_code ec, std::size_t){
        on_write(ec);
    };
    if(udp_) {
        udp_->async_send_to(asio::buffer(front.data), *front.to, std::move(on_written));
    } else if(tls_) {
        asio::async_write(*tls_, asio::buffer(front.data), std::move(on_written));
    } else {
        asio::async_write(*tcp_, asio::buffer(front.data), std::move(on_written));
    }
}

void Session::on_write(std::error_code ec){
    if(ec) {
        log_debug(logger_.get(), "Write to {} failed: {}", remote_, ec.message());
        auto failed = std::move(write_queue_);
        write_queue_.clear();
        for(auto& pending : failed) {
            if(pending.handler) pending.handler(ec);
        }
        if(close_after_flush_) close();
        return;
    }
    auto handler = std::move(write_queue_.front().handler);
    write_queue_.pop_front();
    if(handler) handler({});
    if(!write_queue_.empty()) {
        do_write();
    } else if(close_after_flush_) {
        close();
    }
}

void Session::close(){
    auto expected = state();
    for(;;) {
        if(expected == State::Closing || expected == State::Closed) return;
        if(state_.compare_exchange_weak(expected, State::Closing)) break;
    }
    auto self = shared_from_this();
    asio::dispatch(io_, [this, self](){
        do_close();
    });
}

void Session::close_gracefully(std::chrono::milliseconds deadline){
    auto self = shared_from_this();
    asio::post(io_, [this, self, deadline](){
        if(state() != State::Connected || write_queue_.empty()) {
            close();
            return;
        }
        close_after_flush_ = true;
        deadline_timer_.expires_after(deadline);
        deadline_timer_.async_wait([this, self](const std::error_code& ec){
            if(!ec) close();
        });
    });
}

void Session::do_close(){
    if(state() == State::Closed) return;
    std::error_code ignored;
    deadline_timer_.cancel();
    if(tcp_resolver_) tcp_resolver_->cancel();
    if(udp_resolver_) udp_resolver_->cancel();
    if(tls_) {
        tls_->lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
        tls_->lowest_layer().close(ignored);
    }
    if(tcp_) {
        tcp_->shutdown(tcp::socket::shutdown_both, ignored);
        tcp_->close(ignored);
    }
    if(udp_) {
        udp_->close(ignored);
    }
    state_ = State::Closed;
    log_debug(logger_.get(), "Session {} closed", remote_.empty() ? local_ : remote_);
}

tcp::socket& Session::tcp_layer(){
    if(tls_) return tls_->next_layer();
    return *tcp_;
}

void Session::record_endpoints(){
    std::error_code ec;
    if(udp_) {
        auto local = udp_->local_endpoint(ec);
        if(!ec) {
            local_ = format_endpoint(local);
            local_port_ = local.port();
        }
        const auto* udp = std::get_if<UdpTransport>(&transport_);
        if(udp && udp->target.port() != 0) remote_ = format_endpoint(udp->target);
        return;
    }
    if(!tls_ && !tcp_) return;
    auto& socket = tcp_layer();
    auto local = socket.local_endpoint(ec);
    if(!ec) {
        local_ = format_endpoint(local);
        local_port_ = local.port();
    }
    auto remote = socket.remote_endpoint(ec);
    if(!ec) remote_ = format_endpoint(remote);
}

std::string Session::local_endpoint() const {
    return local_;
}

std::string Session::remote_endpoint() const {
    return remote_;
}
