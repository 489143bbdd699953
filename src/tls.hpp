#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <memory>
#include <string>
#include <system_error>

class Logger;

struct TlsConfig {
  std::string cert_file;
  std::string key_file;
  bool verify_peer = false;
  // SNI name sent by clients; the connect host is used when empty.
  std::string server_name;
};

// Contexts are shared by every session created from them. On failure the
// result is null and `ec` holds NdogError::tls_config_invalid.
std::shared_ptr<asio::ssl::context> make_client_tls_context(const TlsConfig& config,
                                                            std::error_code& ec,
                                                            Logger* logger = nullptr);

// Without cert_file/key_file an in-memory self-signed certificate is
// generated and a warning is logged.
std::shared_ptr<asio::ssl::context> make_server_tls_context(const TlsConfig& config,
                                                            std::error_code& ec,
                                                            Logger* logger = nullptr);

// Self-signed RSA-2048 certificate for CN=`common_name`, valid for a year.
bool install_ephemeral_certificate(asio::ssl::context& ctx,
                                   const std::string& common_name,
                                   std::string& error);
