#include "tls.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace {

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct X509Deleter {
  void operator()(X509* cert) const { X509_free(cert); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  if(code == 0) return "unknown OpenSSL error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

std::shared_ptr<asio::ssl::context> make_base_context() {
  auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls);
  ctx->set_options(asio::ssl::context::default_workarounds |
                   asio::ssl::context::no_sslv2 |
                   asio::ssl::context::no_sslv3 |
                   asio::ssl::context::single_dh_use);
  return ctx;
}

} // namespace

bool install_ephemeral_certificate(asio::ssl::context& ctx,
                                   const std::string& common_name,
                                   std::string& error) {
  EvpPkeyPtr key(EVP_RSA_gen(2048));
  if(!key) {
    error = "RSA key generation failed: " + last_openssl_error();
    return false;
  }

  X509Ptr cert(X509_new());
  if(!cert) {
    error = "X509_new failed: " + last_openssl_error();
    return false;
  }
  X509_set_version(cert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), 365L * 24 * 3600);
  X509_set_pubkey(cert.get(), key.get());

  X509_NAME* name = X509_get_subject_name(cert.get());
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char*>(common_name.c_str()),
                             -1, -1, 0);
  X509_set_issuer_name(cert.get(), name);

  if(X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
    error = "certificate signing failed: " + last_openssl_error();
    return false;
  }

  SSL_CTX* native = ctx.native_handle();
  if(SSL_CTX_use_certificate(native, cert.get()) != 1) {
    error = "unable to install certificate: " + last_openssl_error();
    return false;
  }
  if(SSL_CTX_use_PrivateKey(native, key.get()) != 1) {
    error = "unable to install private key: " + last_openssl_error();
    return false;
  }
  return true;
}

std::shared_ptr<asio::ssl::context> make_client_tls_context(const TlsConfig& config,
                                                            std::error_code& ec,
                                                            Logger* logger) {
  ec.clear();
  auto ctx = make_base_context();
  std::error_code op;
  if(config.verify_peer) {
    ctx->set_default_verify_paths(op);
    if(!op) ctx->set_verify_mode(asio::ssl::verify_peer, op);
  } else {
    ctx->set_verify_mode(asio::ssl::verify_none, op);
  }
  if(!op && !config.cert_file.empty()) {
    ctx->use_certificate_chain_file(config.cert_file, op);
  }
  if(!op && !config.key_file.empty()) {
    ctx->use_private_key_file(config.key_file, asio::ssl::context::pem, op);
  }
  if(op) {
    log_error(logger, "TLS client setup failed: {}", op.message());
    ec = NdogError::tls_config_invalid;
    return nullptr;
  }
  return ctx;
}

std::shared_ptr<asio::ssl::context> make_server_tls_context(const TlsConfig& config,
                                                            std::error_code& ec,
                                                            Logger* logger) {
  ec.clear();
  auto ctx = make_base_context();

  if(config.cert_file.empty() != config.key_file.empty()) {
    log_error(logger, "TLS listener needs both --cert and --key (or neither)");
    ec = NdogError::tls_config_invalid;
    return nullptr;
  }

  if(config.cert_file.empty()) {
    std::string error;
    if(!install_ephemeral_certificate(*ctx, "ndog", error)) {
      log_error(logger, "TLS listener setup failed: {}", error);
      ec = NdogError::tls_config_invalid;
      return nullptr;
    }
    log_warn(logger, "No certificate given, using an ephemeral self-signed certificate");
    return ctx;
  }

  std::error_code op;
  ctx->use_certificate_chain_file(config.cert_file, op);
  if(!op) ctx->use_private_key_file(config.key_file, asio::ssl::context::pem, op);
  if(op) {
    log_error(logger, "TLS listener setup failed ({} / {}): {}",
              config.cert_file, config.key_file, op.message());
    ec = NdogError::tls_config_invalid;
    return nullptr;
  }
  return ctx;
}
