#include "errors.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

namespace {

class NdogCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "ndog"; }

  std::string message(int value) const override {
    switch(static_cast<NdogError>(value)) {
      case NdogError::connect_refused:      return "connection refused";
      case NdogError::connect_timeout:      return "connection timed out";
      case NdogError::resolve_failed:       return "unable to resolve host";
      case NdogError::bind_failed:          return "unable to bind port";
      case NdogError::tls_handshake_failed: return "TLS handshake failed";
      case NdogError::tls_config_invalid:   return "invalid TLS configuration";
      case NdogError::transfer_io_failed:   return "file I/O failed during transfer";
      case NdogError::transfer_incomplete:  return "incomplete file transfer";
      case NdogError::peer_send_failed:     return "send to peer failed";
      case NdogError::not_connected:        return "not connected";
      case NdogError::unsupported_mode:     return "mode not supported for this transport";
    }
    return "unknown ndog error";
  }
};

} // namespace

const std::error_category& ndog_category() noexcept {
  static NdogCategory category;
  return category;
}

std::error_code make_error_code(NdogError e) noexcept {
  return {static_cast<int>(e), ndog_category()};
}

bool is_connect_error(const std::error_code& ec) {
  return ec == NdogError::connect_refused ||
         ec == NdogError::connect_timeout ||
         ec == NdogError::resolve_failed;
}

bool is_bind_error(const std::error_code& ec) {
  return ec == NdogError::bind_failed;
}

bool is_tls_error(const std::error_code& ec) {
  return ec == NdogError::tls_handshake_failed ||
         ec == NdogError::tls_config_invalid;
}

bool is_transfer_error(const std::error_code& ec) {
  return ec == NdogError::transfer_io_failed ||
         ec == NdogError::transfer_incomplete;
}

bool is_disconnect(const std::error_code& ec) {
  return ec == asio::error::eof ||
         ec == asio::error::connection_reset ||
         ec == asio::error::connection_aborted ||
         ec == asio::error::operation_aborted ||
         ec == asio::error::broken_pipe ||
         ec == asio::error::bad_descriptor ||
         ec == asio::ssl::error::stream_truncated;
}
