#include "transfer_codec.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "session.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <vector>

namespace {

std::string_view trim(std::string_view text) {
  auto is_space = [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while(!text.empty() && is_space(text.front())) text.remove_prefix(1);
  while(!text.empty() && is_space(text.back())) text.remove_suffix(1);
  return text;
}

class FileSender : public std::enable_shared_from_this<FileSender> {
public:
  FileSender(std::shared_ptr<Session> session,
             std::filesystem::path path,
             TransferOptions options,
             TransferHandler handler,
             std::shared_ptr<Logger> logger)
    : session_(std::move(session)),
      options_(std::move(options)),
      handler_(std::move(handler)),
      logger_(std::move(logger)),
      pacing_timer_(session_->io()) {
    result_.path = std::move(path);
  }

  void start() {
    std::error_code ec;
    auto size = std::filesystem::file_size(result_.path, ec);
    if(!ec) {
      file_.open(result_.path, std::ios::binary);
    }
    if(ec || !file_) {
      log_error(logger_.get(), "Unable to open {} for sending: {}",
                result_.path.string(), ec ? ec.message() : "open failed");
      finish(NdogError::transfer_io_failed);
      return;
    }

    result_.header.name = sanitize_transfer_name(result_.path.filename().string());
    result_.header.size = size;
    result_.header_received = true;
    udp_ = session_->protocol() == Protocol::udp;

    log_info(logger_.get(), "Sending {} ({} bytes) to {}",
             result_.header.name, size, session_->remote_endpoint());

    auto self = shared_from_this();
    session_->send(format_transfer_header(result_.header), [this, self](std::error_code ec){
      if(ec) {
        finish(ec);
        return;
      }
      if(udp_) {
        pace(options_.udp_header_gap);
      } else {
        send_next_chunk();
      }
    });
  }

private:
  void pace(std::chrono::milliseconds gap) {
    if(gap.count() <= 0) {
      send_next_chunk();
      return;
    }
    auto self = shared_from_this();
    pacing_timer_.expires_after(gap);
    pacing_timer_.async_wait([this, self](const std::error_code& ec){
      if(ec) {
        finish(ec);
        return;
      }
      send_next_chunk();
    });
  }

  void send_next_chunk() {
    if(options_.stop && options_.stop->raised()) {
      finish(asio::error::operation_aborted);
      return;
    }
    std::string chunk(kTransferChunkSize, '\0');
    file_.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    auto got = static_cast<std::size_t>(file_.gcount());
    if(got == 0) {
      if(file_.bad()) {
        finish(NdogError::transfer_io_failed);
      } else {
        finish({});
      }
      return;
    }
    chunk.resize(got);

    auto self = shared_from_this();
    session_->send(std::move(chunk), [this, self, got](std::error_code ec){
      if(ec) {
        finish(ec);
        return;
      }
      result_.bytes += got;
      if(result_.bytes >= result_.header.size) {
        finish({});
      } else if(udp_) {
        pace(options_.udp_chunk_gap);
      } else {
        send_next_chunk();
      }
    });
  }

  void finish(std::error_code ec) {
    if(done_) return;
    done_ = true;
    if(!ec && result_.bytes != result_.header.size) {
      ec = NdogError::transfer_incomplete;
    }
    if(ec && !is_transfer_error(ec)) {
      log_warn(logger_.get(), "Send of {} stopped after {} of {} bytes: {}",
               result_.header.name, result_.bytes, result_.header.size, ec.message());
      ec = NdogError::transfer_incomplete;
    } else if(!ec) {
      log_info(logger_.get(), "Sent {} ({} bytes)", result_.header.name, result_.bytes);
    }
    result_.ec = ec;
    if(handler_) handler_(result_);
  }

  std::shared_ptr<Session> session_;
  TransferOptions options_;
  TransferHandler handler_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer pacing_timer_;
  std::ifstream file_;
  TransferResult result_;
  bool udp_ = false;
  bool done_ = false;
};

class FileReceiver : public std::enable_shared_from_this<FileReceiver> {
public:
  FileReceiver(std::shared_ptr<Session> session,
               std::filesystem::path destination,
               TransferOptions options,
               TransferHandler handler,
               std::shared_ptr<Logger> logger)
    : session_(std::move(session)),
      destination_(std::move(destination)),
      options_(std::move(options)),
      handler_(std::move(handler)),
      logger_(std::move(logger)),
      watchdog_(session_->io()) {}

  void start() {
    udp_ = session_->protocol() == Protocol::udp;
    last_activity_ = std::chrono::steady_clock::now();
    log_debug(logger_.get(), "Waiting for a transfer header from {}",
              session_->remote_endpoint().empty() ? session_->local_endpoint() : session_->remote_endpoint());
    schedule_watchdog();
    read_next();
  }

private:
  void read_next() {
    if(done_) return;
    auto self = shared_from_this();
    session_->async_read_some(asio::buffer(buffer_),
      [this, self](std::error_code ec, std::size_t n, const asio::ip::udp::endpoint& from){
        if(done_) return;
        if(ec) {
          log_debug(logger_.get(), "Transfer read ended: {}", ec.message());
          finish(is_disconnect(ec) ? std::error_code() : ec);
          return;
        }
        if(n == 0) {
          if(!udp_) {
            finish({});
            return;
          }
          read_next();
          return;
        }
        if(udp_ && sender_locked_ && from != sender_) {
          read_next();
          return;
        }
        last_activity_ = std::chrono::steady_clock::now();
        if(udp_) {
          on_datagram(std::string_view(buffer_.data(), n), from);
        } else {
          on_stream_bytes(std::string_view(buffer_.data(), n));
        }
        if(!done_) read_next();
      });
  }

  void on_stream_bytes(std::string_view data) {
    if(result_.header_received) {
      write_payload(data);
      return;
    }
    auto newline = data.find('\n');
    if(newline == std::string_view::npos) {
      header_buffer_.append(data.data(), data.size());
      if(header_buffer_.size() >= kMaxHeaderLength) {
        // no terminator in sight; treat what we have as the header
        accept_header(header_buffer_);
      }
      return;
    }
    header_buffer_.append(data.data(), newline);
    accept_header(header_buffer_);
    if(!done_) write_payload(data.substr(newline + 1));
  }

  void on_datagram(std::string_view data, const asio::ip::udp::endpoint& from) {
    if(!result_.header_received) {
      sender_ = from;
      sender_locked_ = true;
      accept_header(data);
      return;
    }
    write_payload(data);
  }

  void accept_header(std::string_view text) {
    result_.header = parse_transfer_header(text);
    result_.header_received = true;
    result_.path = resolve_destination(destination_, result_.header.name);

    std::error_code ec;
    if(result_.path.has_parent_path()) {
      std::filesystem::create_directories(result_.path.parent_path(), ec);
    }
    file_.open(result_.path, std::ios::binary | std::ios::trunc);
    if(!file_) {
      log_error(logger_.get(), "Unable to open {} for writing", result_.path.string());
      finish(NdogError::transfer_io_failed);
      return;
    }
    log_info(logger_.get(), "Receiving {} ({} bytes) into {}",
             result_.header.name, result_.header.size, result_.path.string());
    if(result_.header.size == 0) {
      finish({});
    }
  }

  void write_payload(std::string_view data) {
    if(data.empty() || done_) return;
    auto remaining = result_.header.size - result_.bytes;
    auto take = static_cast<std::size_t>(std::min<uint64_t>(remaining, data.size()));
    if(take < data.size()) {
      log_debug(logger_.get(), "Dropping {} bytes past the declared size", data.size() - take);
    }
    file_.write(data.data(), static_cast<std::streamsize>(take));
    if(!file_) {
      log_error(logger_.get(), "Write to {} failed", result_.path.string());
      finish(NdogError::transfer_io_failed);
      return;
    }
    result_.bytes += take;
    if(result_.bytes >= result_.header.size) {
      finish({});
    }
  }

  void schedule_watchdog() {
    auto self = shared_from_this();
    auto tick = std::min(options_.poll_interval, options_.idle_timeout);
    if(tick.count() <= 0) tick = std::chrono::milliseconds(200);
    watchdog_.expires_after(tick);
    watchdog_.async_wait([this, self](const std::error_code& ec){
      if(ec || done_) return;
      if(options_.stop && options_.stop->raised()) {
        finish(asio::error::operation_aborted);
        session_->close();
        return;
      }
      bool idle_applies = result_.header_received || options_.idle_before_header;
      if(idle_applies && std::chrono::steady_clock::now() - last_activity_ >= options_.idle_timeout) {
        log_warn(logger_.get(), "No data for {} ms, giving up", options_.idle_timeout.count());
        finish({});
        session_->close();
        return;
      }
      schedule_watchdog();
    });
  }

  void finish(std::error_code ec) {
    if(done_) return;
    done_ = true;
    watchdog_.cancel();
    if(file_.is_open()) {
      file_.flush();
      file_.close();
    }

    if(!ec && (!result_.header_received || result_.bytes < result_.header.size)) {
      ec = NdogError::transfer_incomplete;
    } else if(ec && !is_transfer_error(ec) && result_.header_received) {
      ec = NdogError::transfer_incomplete;
    }

    if(!ec) {
      log_info(logger_.get(), "Received {} ({} bytes)", result_.path.string(), result_.bytes);
    } else if(ec == NdogError::transfer_incomplete) {
      if(result_.header_received) {
        log_warn(logger_.get(), "Incomplete transfer: {} of {} bytes written to {}",
                 result_.bytes, result_.header.size, result_.path.string());
      } else {
        log_warn(logger_.get(), "Incomplete transfer: no header received");
      }
    }
    result_.ec = ec;
    if(handler_) handler_(result_);
  }

  std::shared_ptr<Session> session_;
  std::filesystem::path destination_;
  TransferOptions options_;
  TransferHandler handler_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer watchdog_;
  std::array<char, kTransferChunkSize> buffer_{};
  std::string header_buffer_;
  std::ofstream file_;
  TransferResult result_;
  asio::ip::udp::endpoint sender_;
  bool sender_locked_ = false;
  std::chrono::steady_clock::time_point last_activity_;
  bool udp_ = false;
  bool done_ = false;
};

} // namespace

std::string sanitize_transfer_name(std::string_view name) {
  name = trim(name);
  auto slash = name.find_last_of("/\\");
  if(slash != std::string_view::npos) {
    name.remove_prefix(slash + 1);
  }
  if(name.empty() || name == "." || name == "..") {
    return kPlaceholderName;
  }
  return std::string(name);
}

TransferHeader parse_transfer_header(std::string_view text) {
  TransferHeader fallback{kPlaceholderName, 0};
  auto line = text.substr(0, text.find('\n'));
  auto separator = line.find(':');
  if(separator == std::string_view::npos) {
    return fallback;
  }

  auto size_text = trim(line.substr(separator + 1));
  if(size_text.empty()) {
    return fallback;
  }
  uint64_t size = 0;
  auto [end, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size);
  if(ec != std::errc() || end != size_text.data() + size_text.size()) {
    return fallback;
  }

  return TransferHeader{sanitize_transfer_name(line.substr(0, separator)), size};
}

std::string format_transfer_header(const TransferHeader& header) {
  return fmt::format("{}:{}\n", header.name, header.size);
}

std::filesystem::path resolve_destination(const std::filesystem::path& destination,
                                          const std::string& header_name) {
  auto name = sanitize_transfer_name(header_name);
  if(destination.empty() || destination == "-") {
    return std::filesystem::current_path() / name;
  }
  std::error_code ec;
  if(std::filesystem::is_directory(destination, ec)) {
    return destination / name;
  }
  return destination;
}

void async_send_file(std::shared_ptr<Session> session,
                     const std::filesystem::path& path,
                     TransferOptions options,
                     TransferHandler handler,
                     std::shared_ptr<Logger> logger) {
  auto sender = std::make_shared<FileSender>(session, path, std::move(options),
                                             std::move(handler), std::move(logger));
  asio::dispatch(session->io(), [sender](){ sender->start(); });
}

void async_receive_file(std::shared_ptr<Session> session,
                        const std::filesystem::path& destination,
                        TransferOptions options,
                        TransferHandler handler,
                        std::shared_ptr<Logger> logger) {
  auto receiver = std::make_shared<FileReceiver>(session, destination, std::move(options),
                                                 std::move(handler), std::move(logger));
  asio::dispatch(session->io(), [receiver](){ receiver->start(); });
}
