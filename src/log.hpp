#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Mirrors every line written by the default loggers into `path`, with ANSI
// colour sequences removed. Returns false and fills `error` when the file
// cannot be opened.
bool set_log_file(const std::filesystem::path& path, std::string& error);
void close_log_file();

// Logger writing only to the log file (pattern "%v"); null when no log file
// is configured. The console uses it to mirror raw payload lines.
std::shared_ptr<spdlog::logger> mirror_logger();

// print and print_err carry user-facing text without a timestamp.
enum class LogChannel { info, warn, error, debug, print, print_err };

const char* channel_name(LogChannel channel);

constexpr spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::warn:      return spdlog::level::warn;
    case LogChannel::error:
    case LogChannel::print_err: return spdlog::level::err;
    case LogChannel::debug:     return spdlog::level::debug;
    default:                    return spdlog::level::info;
  }
}

namespace detail {
// Writes to the process-wide spdlog loggers. `qualified` is the channel
// prefixed with the logger name, or empty.
void emit_to_default(LogChannel channel,
                     const std::string& qualified,
                     const std::string& message);
} // namespace detail

using LogListenerHandle = std::size_t;

// Named logger. Lines go to the registered listeners first; when none of
// them claims a line it falls through to the default loggers.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    deliver(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::error, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::debug, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::print, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::print_err, fmt, std::forward<Args>(args)...);
  }

private:
  void deliver(LogChannel channel, const std::string& message);
  bool notify_listeners(const std::string& qualified,
                        spdlog::level::level_enum level,
                        const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Routes through `logger` when there is one, else straight to the defaults.
template<typename... Args>
inline void log_to(Logger* logger,
                   LogChannel channel,
                   spdlog::format_string_t<Args...> fmt,
                   Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  detail::emit_to_default(channel, {}, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::print_err, fmt, std::forward<Args>(args)...);
}
