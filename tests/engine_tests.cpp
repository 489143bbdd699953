#include "test_runner_utils.hpp"
#include "loopback.hpp"

#include "local_io.hpp"
#include "ndog_engine.hpp"
#include "session.hpp"
#include "settings_manager.hpp"

#include <array>
#include <future>
#include <iostream>

namespace ndog::test {
namespace {

using namespace std::chrono_literals;

constexpr int kPollMs = 50;

// An engine running on its own thread with captured stdout and scripted input.
struct EngineRun {
  EngineRun(std::shared_ptr<SettingsManager> settings, std::string input)
    : engine(std::make_shared<NdogEngine>(std::move(settings), options(std::move(input)))) {
    auto runner = engine;
    result = std::async(std::launch::async, [runner](){ return runner->run(); });
  }

  ~EngineRun() {
    if(result.valid()) {
      engine->request_stop();
      result.wait();
    }
  }

  NdogEngine::Options options(std::string input) {
    NdogEngine::Options opts;
    opts.input_factory = [input]() -> std::unique_ptr<LocalInput> {
      return std::make_unique<BufferInput>(input);
    };
    opts.console_writer = [this](std::string_view text){ out.append(text); };
    opts.handle_signals = false;
    return opts;
  }

  // Exit code, or -1 when the engine did not finish in time.
  int finish_within(std::chrono::milliseconds timeout) {
    if(result.wait_for(timeout) != std::future_status::ready) return -1;
    return result.get();
  }

  int stop() {
    engine->request_stop();
    return finish_within(5s);
  }

  ByteSink out;
  std::shared_ptr<NdogEngine> engine;
  std::future<int> result;
};

std::shared_ptr<SettingsManager> base_settings() {
  auto settings = std::make_shared<SettingsManager>();
  configure(*settings, "poll_interval_ms", kPollMs);
  configure(*settings, "color", false);
  return settings;
}

std::shared_ptr<SettingsManager> listener_settings(bool udp = false) {
  auto settings = base_settings();
  configure(*settings, "listen", true);
  configure(*settings, "port", 0);
  configure(*settings, "udp", udp);
  return settings;
}

std::shared_ptr<SettingsManager> client_settings(uint16_t port) {
  auto settings = base_settings();
  configure(*settings, "host", "127.0.0.1");
  configure(*settings, "port", port);
  configure(*settings, "wait", 2);
  return settings;
}

bool test_tcp_listener_shows_client_data(TestContext& ctx) {
  TempDir dir("engine_mirror");
  auto mirror = dir / "session.log";
  auto settings = listener_settings();
  configure(*settings, "output", mirror.string());

  EngineRun listener(settings, "");
  ctx.logs.attach(listener.engine->logger(), "listener");
  auto port = listener.engine->wait_for_port(2s);
  if(!port) return false;

  IoThread io;
  auto client = connect_tcp(io.io(), *port, ctx.logger);
  client->send("hello engine\n");
  bool shown = listener.out.wait_for_substring("hello engine\n", 2s);
  client->close();

  int code = listener.stop();
  auto mirrored = read_file(mirror);
  if(ctx.verbose && !mirrored) std::cout << "\n    no mirror file";
  return shown && code == 0 &&
         mirrored && mirrored->find("hello engine") != std::string::npos;
}

bool test_client_refused_exits_nonzero(TestContext& ctx) {
  IoThread io;
  auto port = closed_tcp_port(io.io());
  EngineRun client(client_settings(port), "");
  return client.finish_within(5s) == 1 && !client.engine->wait_for_port(10ms);
}

bool test_client_message_mode(TestContext&) {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto port = acceptor.local_endpoint().port();

  std::promise<std::string> received;
  auto future = received.get_future();
  std::thread server([&](){
    std::error_code ec;
    asio::ip::tcp::socket socket(io);
    acceptor.accept(socket, ec);
    if(ec) {
      received.set_value("accept failed: " + ec.message());
      return;
    }
    std::string data;
    std::array<char, 256> buffer{};
    for(;;) {
      auto n = socket.read_some(asio::buffer(buffer), ec);
      if(ec) break;
      data.append(buffer.data(), n);
    }
    received.set_value(data);
  });

  auto settings = client_settings(port);
  configure(*settings, "message", "ping");
  // the message replaces stdin; this input is never read
  EngineRun client(settings, "ignored\n");
  int code = client.finish_within(5s);

  bool ok = future.wait_for(5s) == std::future_status::ready;
  if(!ok) acceptor.close();
  server.join();
  return ok && code == 0 && future.get() == "ping\n";
}

bool test_file_transfer_between_engines(TestContext& ctx) {
  TempDir dir("engine_transfer");
  auto source = dir / "report.bin";
  auto data = random_bytes(3 * 8192 + 17, 5);
  write_file(source, data);
  auto inbox = dir / "inbox";
  std::filesystem::create_directories(inbox);

  auto receiving = listener_settings();
  configure(*receiving, "receive_file", inbox.string());
  EngineRun listener(receiving, "");
  ctx.logs.attach(listener.engine->logger(), "listener");
  auto port = listener.engine->wait_for_port(2s);
  if(!port) return false;

  auto sending = client_settings(*port);
  configure(*sending, "send_file", source.string());
  EngineRun client(sending, "");

  int client_code = client.finish_within(10s);
  // a single exchange ends the listener without a stop request
  int listener_code = listener.finish_within(10s);
  auto copy = read_file(inbox / "report.bin");
  return client_code == 0 && listener_code == 0 && copy && *copy == data;
}

bool test_udp_listener_shows_datagrams(TestContext& ctx) {
  auto settings = listener_settings(true);
  configure(*settings, "hex", false);
  EngineRun listener(settings, "");
  auto port = listener.engine->wait_for_port(2s);
  if(!port) return false;

  IoThread io;
  auto client = connect_udp(io.io(), *port, ctx.logger);
  client->send("udp hello\n");
  bool shown = listener.out.wait_for_substring("udp hello\n", 2s);
  client->close();
  return shown && listener.stop() == 0;
}

bool test_chat_client_sends_lines(TestContext& ctx) {
  EngineRun listener(listener_settings(), "");
  auto port = listener.engine->wait_for_port(2s);
  if(!port) return false;

  auto settings = client_settings(*port);
  configure(*settings, "chat", true);
  configure(*settings, "keep_open", true);
  EngineRun client(settings, "hello chat\n/whoami\n");
  ctx.logs.attach(client.engine->logger(), "chat");

  bool delivered = listener.out.wait_for_substring("hello chat\n", 3s);
  bool echoed = client.out.wait_for_substring("[YOU] hello chat", 2s);
  // /whoami stays local and prints our endpoint
  bool local = client.out.wait_for_substring("127.0.0.1:", 2s);
  bool leaked = listener.out.str().find("/whoami") != std::string::npos;

  int client_code = client.stop();
  int listener_code = listener.stop();
  return delivered && echoed && local && !leaked && client_code == 0 && listener_code == 0;
}

} // namespace

void add_engine_tests(std::vector<TestCase>& tests) {
  tests.push_back({"engine_tcp_listener_shows_client_data", test_tcp_listener_shows_client_data});
  tests.push_back({"engine_client_refused_exits_nonzero", test_client_refused_exits_nonzero});
  tests.push_back({"engine_client_message_mode", test_client_message_mode});
  tests.push_back({"engine_file_transfer", test_file_transfer_between_engines});
  tests.push_back({"engine_udp_listener", test_udp_listener_shows_datagrams});
  tests.push_back({"engine_chat_client", test_chat_client_sends_lines});
}

} // namespace ndog::test
