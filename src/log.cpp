#include "log.hpp"

#include "utils.hpp"

#include <spdlog/details/file_helper.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <mutex>
#include <vector>

namespace {

// File sink that drops ANSI colour sequences before writing, so the log
// file stays plain text whatever the console rendered.
template<typename Mutex>
class ansi_stripping_file_sink final : public spdlog::sinks::base_sink<Mutex> {
public:
  explicit ansi_stripping_file_sink(const spdlog::filename_t& filename) {
    file_helper_.open(filename, true);
  }

protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    spdlog::memory_buf_t formatted;
    this->formatter_->format(msg, formatted);
    auto plain = strip_ansi(std::string(formatted.data(), formatted.size()));
    spdlog::memory_buf_t out;
    out.append(plain.data(), plain.data() + plain.size());
    file_helper_.write(out);
  }

  void flush_() override {
    file_helper_.flush();
  }

private:
  spdlog::details::file_helper file_helper_;
};

using ansi_stripping_file_sink_mt = ansi_stripping_file_sink<std::mutex>;

// Console destinations. Diagnostics go to stderr so stdout carries only
// channel payload.
enum class Route { diagnostics, problems, out, err, count };

struct RouteDef {
  const char* name;
  bool to_stdout;
  bool stamped;
  spdlog::level::level_enum flush_level;
};

constexpr RouteDef kRoutes[] = {
  {"ndog.info",      false, true,  spdlog::level::warn},
  {"ndog.error",     false, true,  spdlog::level::err},
  {"ndog.print",     true,  false, spdlog::level::info},
  {"ndog.print_err", false, false, spdlog::level::err},
};

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

std::array<std::shared_ptr<spdlog::logger>, static_cast<std::size_t>(Route::count)> g_loggers;
std::shared_ptr<spdlog::logger> g_mirror_logger;
std::shared_ptr<ansi_stripping_file_sink_mt> g_file_sink;
std::mutex g_file_mutex;
std::once_flag g_init_once;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_route_logger(const RouteDef& def) {
  spdlog::sink_ptr sink;
  if(def.to_stdout) {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
  sink->set_pattern(def.stamped ? kStampedPattern : kPlainPattern);
  auto logger = std::make_shared<spdlog::logger>(def.name, std::move(sink));
  logger->flush_on(def.flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void ensure_loggers() {
  std::call_once(g_init_once, [](){
    for(std::size_t i = 0; i < g_loggers.size(); ++i) {
      g_loggers[i] = make_route_logger(kRoutes[i]);
    }
  });
}

spdlog::logger& route_logger(Route route) {
  return *g_loggers[static_cast<std::size_t>(route)];
}

Route route_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::print:     return Route::out;
    case LogChannel::print_err: return Route::err;
    case LogChannel::warn:
    case LogChannel::error:     return Route::problems;
    case LogChannel::info:
    case LogChannel::debug:     break;
  }
  return Route::diagnostics;
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::info:      return "info";
    case LogChannel::warn:      return "warn";
    case LogChannel::error:     return "error";
    case LogChannel::debug:     return "debug";
    case LogChannel::print:     return "print";
    case LogChannel::print_err: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

bool set_log_file(const std::filesystem::path& path, std::string& error) {
  ensure_loggers();
  close_log_file();

  std::shared_ptr<ansi_stripping_file_sink_mt> sink;
  try {
    sink = std::make_shared<ansi_stripping_file_sink_mt>(path.string());
  } catch(const spdlog::spdlog_ex& e) {
    error = e.what();
    return false;
  }
  sink->set_pattern(kPlainPattern);

  std::lock_guard<std::mutex> lock(g_file_mutex);
  for(auto& logger : g_loggers) {
    logger->sinks().push_back(sink);
  }
  g_mirror_logger = std::make_shared<spdlog::logger>("ndog.mirror", sink);
  g_mirror_logger->set_level(spdlog::level::info);
  g_mirror_logger->flush_on(spdlog::level::info);
  g_file_sink = std::move(sink);
  return true;
}

void close_log_file() {
  std::lock_guard<std::mutex> lock(g_file_mutex);
  if(!g_file_sink) return;
  for(auto& logger : g_loggers) {
    if(!logger) continue;
    auto& sinks = logger->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), g_file_sink), sinks.end());
  }
  g_file_sink->flush();
  g_mirror_logger.reset();
  g_file_sink.reset();
}

std::shared_ptr<spdlog::logger> mirror_logger() {
  std::lock_guard<std::mutex> lock(g_file_mutex);
  return g_mirror_logger;
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::deliver(LogChannel channel, const std::string& message) {
  std::string qualified = channel_name(channel);
  if(!name_.empty()) qualified = name_ + ":" + qualified;
  if(notify_listeners(qualified, channel_level(channel), message)) return;
  detail::emit_to_default(channel, qualified, message);
}

bool Logger::notify_listeners(const std::string& qualified,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, qualified, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::error, "log",
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  for(auto& logger : g_loggers) logger->set_level(spdlog::level::info);
  route_logger(Route::diagnostics).set_level(level);

  spdlog::set_default_logger(g_loggers[static_cast<std::size_t>(Route::diagnostics)]);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& qualified,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  auto& target = route_logger(route_for(channel));
  auto level = channel_level(channel);
  if(qualified.empty() || qualified == channel_name(channel)) {
    target.log(level, message);
  } else {
    target.log(level, fmt::format("[{}] {}", qualified, message));
  }
}

} // namespace detail
