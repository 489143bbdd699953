#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "transport.hpp"

class Logger;
class Session;

// Wire format: "<name>:<size>\n" followed by exactly <size> raw bytes. Over
// UDP the header is its own datagram and each chunk is one datagram.
inline constexpr std::size_t kTransferChunkSize = 8192;
inline constexpr std::size_t kMaxHeaderLength = 8192;
inline constexpr const char* kPlaceholderName = "received_file";

struct TransferHeader {
  std::string name;
  uint64_t size = 0;
};

// Never throws. Splits on the first ':'; anything malformed yields
// {kPlaceholderName, 0}. The name is reduced to a bare file name.
TransferHeader parse_transfer_header(std::string_view text);
std::string format_transfer_header(const TransferHeader& header);

// Last path component of `name`, or the placeholder if nothing usable is left.
std::string sanitize_transfer_name(std::string_view name);

// "-" or empty: header name in the current directory. An existing
// directory: dir/<header name>. Anything else is used as given.
std::filesystem::path resolve_destination(const std::filesystem::path& destination,
                                          const std::string& header_name);

struct TransferResult {
  std::error_code ec;
  TransferHeader header;
  bool header_received = false;
  uint64_t bytes = 0;
  std::filesystem::path path;

  bool complete() const { return !ec && header_received && bytes == header.size; }
};

struct TransferOptions {
  // Receive gives up after this long without data.
  std::chrono::milliseconds idle_timeout{std::chrono::seconds(10)};
  // When false the idle limit starts with the header, so a listener waits for its first sender.
  bool idle_before_header = true;
  // UDP pacing so a local receiver is not flooded.
  std::chrono::milliseconds udp_header_gap{50};
  std::chrono::milliseconds udp_chunk_gap{1};
  std::chrono::milliseconds poll_interval{200};
  std::shared_ptr<StopSignal> stop;
};

using TransferHandler = std::function<void(const TransferResult&)>;

// Both calls return immediately; the handler runs once on the io thread.
// A short transfer reports NdogError::transfer_incomplete and keeps what
// was written; file errors report NdogError::transfer_io_failed.
void async_send_file(std::shared_ptr<Session> session,
                     const std::filesystem::path& path,
                     TransferOptions options,
                     TransferHandler handler,
                     std::shared_ptr<Logger> logger = nullptr);

void async_receive_file(std::shared_ptr<Session> session,
                        const std::filesystem::path& destination,
                        TransferOptions options,
                        TransferHandler handler,
                        std::shared_ptr<Logger> logger = nullptr);
