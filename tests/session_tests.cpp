#include "test_runner_utils.hpp"
#include "loopback.hpp"

#include "duplex_pump.hpp"
#include "errors.hpp"
#include "local_io.hpp"
#include "session.hpp"

#include <array>
#include <future>
#include <iostream>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace ndog::test {
namespace {

using namespace std::chrono_literals;

// Collects everything a session reads until it ends.
class Drain : public std::enable_shared_from_this<Drain> {
public:
  explicit Drain(std::shared_ptr<Session> session) : session_(std::move(session)) {}

  void start() { read(); }

  ByteSink bytes;
  std::promise<std::error_code> ended;

private:
  void read() {
    auto self = shared_from_this();
    session_->async_read_some(asio::buffer(buffer_),
      [self](std::error_code ec, std::size_t n, const asio::ip::udp::endpoint&){
        if(ec || (n == 0 && self->session_->protocol() == Protocol::tcp)) {
          self->ended.set_value(ec ? ec : asio::error::eof);
          return;
        }
        self->bytes.append(std::string_view(self->buffer_.data(), n));
        self->read();
      });
  }

  std::shared_ptr<Session> session_;
  std::array<char, 4096> buffer_{};
};

bool test_connect_refused(TestContext& ctx) {
  IoThread io;
  auto port = closed_tcp_port(io.io());
  std::error_code ec;
  auto session = connect_tcp(io.io(), port, ctx.logger, nullptr, &ec);
  return ec == NdogError::connect_refused &&
         is_connect_error(ec) &&
         session && session->is_closed();
}

bool test_connect_timeout(TestContext& ctx) {
  IoThread io;
  // backlog 0 holds a single pending connection; later SYNs are dropped
  asio::ip::tcp::endpoint loopback(asio::ip::address_v4::loopback(), 0);
  asio::ip::tcp::acceptor full(io.io());
  full.open(loopback.protocol());
  full.bind(loopback);
  full.listen(0);
  loopback.port(full.local_endpoint().port());

  std::vector<std::unique_ptr<asio::ip::tcp::socket>> fillers;
  std::promise<void> queued;
  asio::post(io.io(), [&](){
    for(int i = 0; i < 3; ++i) {
      fillers.push_back(std::make_unique<asio::ip::tcp::socket>(io.io()));
      fillers.back()->async_connect(loopback, [](std::error_code){});
    }
    queued.set_value();
  });
  queued.get_future().wait();
  std::this_thread::sleep_for(100ms);

  Session::ConnectOptions options;
  options.host = "127.0.0.1";
  options.port = loopback.port();
  options.timeout = 200ms;
  auto started = std::chrono::steady_clock::now();
  std::error_code ec;
  auto session = connect_session(io.io(), options, ctx.logger, &ec);
  auto elapsed = std::chrono::steady_clock::now() - started;
  if(ctx.verbose) {
    std::cout << " (gave up after "
              << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms)";
  }

  std::promise<void> cleaned;
  asio::post(io.io(), [&](){
    fillers.clear();
    std::error_code ignored;
    full.close(ignored);
    cleaned.set_value();
  });
  cleaned.get_future().wait();

  return ec == NdogError::connect_timeout &&
         is_connect_error(ec) &&
         session && session->is_closed() &&
         elapsed >= options.timeout &&
         elapsed <= 2 * options.timeout;
}

bool test_tcp_pair_endpoints(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  bool ok = pair.client->is_connected() &&
            pair.server->is_connected() &&
            pair.client->role() == Session::Role::Client &&
            pair.server->role() == Session::Role::Server &&
            pair.client->protocol() == Protocol::tcp &&
            !pair.client->tls_enabled() &&
            pair.client->local_endpoint() == pair.server->remote_endpoint() &&
            pair.client->remote_endpoint() == pair.server->local_endpoint();
  pair.client->close();
  pair.server->close();
  return ok;
}

bool test_udp_connect_announces_client(TestContext& ctx) {
  IoThread io;
  std::error_code ec;
  auto server = Session::listen_udp(io.io(), 0, ec, ctx.logger);
  if(!server || server->protocol() != Protocol::udp) return false;

  std::promise<std::pair<std::size_t, asio::ip::udp::endpoint>> first;
  auto future = first.get_future();
  std::array<char, 64> buffer{};
  server->async_read_some(asio::buffer(buffer),
    [&first](std::error_code read_ec, std::size_t n, const asio::ip::udp::endpoint& from){
      if(read_ec) return;
      first.set_value({n, from});
    });

  auto client = connect_udp(io.io(), server->local_port(), ctx.logger);
  bool ok = future.wait_for(2s) == std::future_status::ready;
  if(ok) {
    auto [n, from] = future.get();
    ok = n == 0 && from.port() == client->local_port();
  }
  ok = ok && is_udp(client->transport()) &&
       std::get<UdpTransport>(client->transport()).target.port() == server->local_port();
  client->close();
  server->close();
  return ok;
}

bool test_close_is_idempotent(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  auto drain = std::make_shared<Drain>(pair.server);
  auto ended = drain->ended.get_future();
  drain->start();

  pair.client->close();
  pair.client->close();
  std::thread other([&](){ pair.client->close(); });
  other.join();
  if(!wait_for_condition([&](){ return pair.client->is_closed(); }, 1s)) return false;

  if(ended.wait_for(2s) != std::future_status::ready) return false;
  if(!is_disconnect(ended.get())) return false;

  std::promise<std::error_code> sent;
  auto sent_future = sent.get_future();
  pair.client->send("late", [&sent](std::error_code ec){ sent.set_value(ec); });
  bool ok = sent_future.wait_for(1s) == std::future_status::ready &&
            sent_future.get() == NdogError::not_connected;
  pair.server->close();
  return ok && std::string(session_state_name(pair.client->state())) == "closed";
}

bool test_writes_keep_order(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  auto drain = std::make_shared<Drain>(pair.server);
  drain->start();

  std::string expected;
  for(int i = 0; i < 500; ++i) {
    auto line = "line " + std::to_string(i) + "\n";
    expected += line;
    pair.client->send(line);
  }
  bool ok = drain->bytes.wait_for_size(expected.size(), 3s) && drain->bytes.str() == expected;
  pair.client->close();
  pair.server->close();
  return ok;
}

bool test_pump_eof_closes_within_two_polls(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  auto drain = std::make_shared<Drain>(pair.server);
  auto ended = drain->ended.get_future();
  drain->start();

  int fds[2];
  if(::pipe(fds) != 0) return false;

  DuplexPump::Options options;
  options.poll_interval = 100ms;
  options.keep_open = false;
  auto stop = std::make_shared<StopSignal>();
  auto pump = DuplexPump::create(pair.client, stop, options, ctx.logger);
  pump->set_local_input(std::make_unique<FdInput>(fds[0], true));
  pump->start();

  const std::string message = "hello over the pipe\n";
  if(::write(fds[1], message.data(), message.size()) != static_cast<ssize_t>(message.size())) {
    ::close(fds[1]);
    return false;
  }
  if(!drain->bytes.wait_for_substring(message, 2s)) {
    ::close(fds[1]);
    return false;
  }

  auto eof_at = std::chrono::steady_clock::now();
  ::close(fds[1]);
  bool closed = wait_for_condition([&](){ return pair.client->is_closed(); }, 2 * options.poll_interval, 1ms);
  auto elapsed = std::chrono::steady_clock::now() - eof_at;
  if(ctx.verbose) {
    std::cout << " (closed after "
              << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms)";
  }

  bool peer_saw_close = ended.wait_for(1s) == std::future_status::ready;
  bool finished = pump->wait_for(1s) && pump->finish_reason() == DuplexPump::FinishReason::local_eof;
  pair.server->close();
  return closed && peer_saw_close && finished && drain->bytes.str() == message;
}

bool test_pump_large_input_reaches_slow_reader(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  const auto payload = random_bytes(8 * 1024 * 1024, 11);

  DuplexPump::Options options;
  options.poll_interval = 50ms;
  auto pump = DuplexPump::create(pair.client, std::make_shared<StopSignal>(), options, ctx.logger);
  pump->set_local_input(std::make_unique<BufferInput>(payload));
  pump->start();

  // nothing reads for a second; local input has to wait for the socket
  std::this_thread::sleep_for(1s);
  bool throttled = !pump->finished() &&
                   pump->in_flight() <= options.max_in_flight + options.read_chunk &&
                   pair.client->is_connected();

  auto drain = std::make_shared<Drain>(pair.server);
  auto ended = drain->ended.get_future();
  drain->start();
  bool complete = drain->bytes.wait_for_size(payload.size(), 10s);
  bool peer_saw_close = ended.wait_for(2s) == std::future_status::ready;
  bool finished = pump->wait_for(1s) && pump->finish_reason() == DuplexPump::FinishReason::local_eof;
  pair.server->close();
  if(ctx.verbose && !complete) {
    std::cout << " (received " << drain->bytes.str().size() << " of " << payload.size() << ")";
  }
  return throttled && complete && peer_saw_close && finished &&
         drain->bytes.str() == payload && pump->bytes_out() == payload.size();
}

bool test_pump_keep_open_after_eof(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);

  DuplexPump::Options options;
  options.poll_interval = 50ms;
  options.keep_open = true;
  auto stop = std::make_shared<StopSignal>();
  auto pump = DuplexPump::create(pair.client, stop, options, ctx.logger);
  ByteSink inbound;
  pump->set_inbound_handler([&inbound](const std::string& data, const asio::ip::udp::endpoint&){
    inbound.append(data);
  });
  pump->set_local_input(std::make_unique<BufferInput>("ping\n"));
  pump->start();

  auto drain = std::make_shared<Drain>(pair.server);
  drain->start();
  if(!drain->bytes.wait_for_substring("ping\n", 2s)) return false;

  std::this_thread::sleep_for(4 * options.poll_interval);
  if(!pair.client->is_connected() || pump->finished()) return false;

  pair.server->send("pong\n");
  bool ok = inbound.wait_for_substring("pong\n", 2s);
  stop->raise();
  ok = ok && pump->wait_for(1s) && pump->finish_reason() == DuplexPump::FinishReason::stopped;
  pair.server->close();
  return ok && pump->bytes_out() == 5 && pump->bytes_in() == 5;
}

bool test_pump_peer_close(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  DuplexPump::Options options;
  options.poll_interval = 50ms;
  auto pump = DuplexPump::create(pair.client, std::make_shared<StopSignal>(), options, ctx.logger);
  std::promise<DuplexPump::FinishReason> reason;
  auto future = reason.get_future();
  pump->set_finished_handler([&reason](DuplexPump::FinishReason r){ reason.set_value(r); });
  pump->start();

  pair.server->close();
  bool ok = future.wait_for(2s) == std::future_status::ready &&
            future.get() == DuplexPump::FinishReason::peer_closed;
  return ok && wait_for_condition([&](){ return pair.client->is_closed(); }, 1s);
}

bool test_pump_start_on_closed_session(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);
  pair.client->close();
  if(!wait_for_condition([&](){ return pair.client->is_closed(); }, 1s)) return false;

  int fds[2];
  if(::pipe(fds) != 0) return false;

  DuplexPump::Options options;
  options.poll_interval = 50ms;
  auto pump = DuplexPump::create(pair.client, std::make_shared<StopSignal>(), options, ctx.logger);
  pump->set_local_input(std::make_unique<FdInput>(fds[0], true));
  // the first read fails at once and finishes the pump while local input starts
  pump->start();
  bool finished = pump->wait_for(1s) && pump->finish_reason() == DuplexPump::FinishReason::peer_closed;

  const std::string late = "late\n";
  bool wrote = ::write(fds[1], late.data(), late.size()) == static_cast<ssize_t>(late.size());
  std::this_thread::sleep_for(3 * options.poll_interval);
  ::close(fds[1]);
  pair.server->close();
  return finished && wrote && pump->bytes_out() == 0;
}

bool test_pump_stop_signal(TestContext& ctx) {
  IoThread io;
  auto pair = make_tcp_pair(io.io(), ctx.logger);

  int fds[2];
  if(::pipe(fds) != 0) return false;

  DuplexPump::Options options;
  options.poll_interval = 100ms;
  auto stop = std::make_shared<StopSignal>();
  auto pump = DuplexPump::create(pair.client, stop, options, ctx.logger);
  // a silent stdin-like pipe: nothing arrives, nothing ends
  pump->set_local_input(std::make_unique<FdInput>(fds[0], true));
  pump->start();
  std::this_thread::sleep_for(150ms);

  stop->raise();
  bool ok = pump->wait_for(2 * options.poll_interval) &&
            pump->finish_reason() == DuplexPump::FinishReason::stopped &&
            wait_for_condition([&](){ return pair.client->is_closed(); }, options.poll_interval);
  ::close(fds[1]);
  pair.server->close();
  return ok;
}

} // namespace

void add_session_tests(std::vector<TestCase>& tests) {
  tests.push_back({"session_connect_refused", test_connect_refused});
  tests.push_back({"session_connect_timeout", test_connect_timeout});
  tests.push_back({"session_tcp_endpoints", test_tcp_pair_endpoints});
  tests.push_back({"session_udp_announce", test_udp_connect_announces_client});
  tests.push_back({"session_close_idempotent", test_close_is_idempotent});
  tests.push_back({"session_write_order", test_writes_keep_order});
  tests.push_back({"pump_eof_closes_within_two_polls", test_pump_eof_closes_within_two_polls});
  tests.push_back({"pump_large_input_slow_reader", test_pump_large_input_reaches_slow_reader});
  tests.push_back({"pump_keep_open", test_pump_keep_open_after_eof});
  tests.push_back({"pump_peer_close", test_pump_peer_close});
  tests.push_back({"pump_start_on_closed_session", test_pump_start_on_closed_session});
  tests.push_back({"pump_stop_signal", test_pump_stop_signal});
}

} // namespace ndog::test
