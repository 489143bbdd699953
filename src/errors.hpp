#pragma once

#include <string>
#include <system_error>

// Error taxonomy shared by every asynchronous operation. Values travel as
// std::error_code through completion handlers, next to asio's own codes.
enum class NdogError {
  connect_refused = 1,
  connect_timeout,
  resolve_failed,
  bind_failed,
  tls_handshake_failed,
  tls_config_invalid,
  transfer_io_failed,
  transfer_incomplete,
  peer_send_failed,
  not_connected,
  unsupported_mode
};

const std::error_category& ndog_category() noexcept;

std::error_code make_error_code(NdogError e) noexcept;

namespace std {
template<>
struct is_error_code_enum<NdogError> : true_type {};
} // namespace std

bool is_connect_error(const std::error_code& ec);
bool is_bind_error(const std::error_code& ec);
bool is_tls_error(const std::error_code& ec);
bool is_transfer_error(const std::error_code& ec);

// True for the codes asio reports when the remote side goes away or the
// socket was closed locally: eof, reset, aborted, truncated TLS stream.
bool is_disconnect(const std::error_code& ec);
