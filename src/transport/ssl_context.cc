#include "realmlink/transport/ssl_context.h"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>

#define REALMLINK_LOG_COMPONENT "transport"
#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace transport {

namespace {

void initializeOpenSSL() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                     nullptr);
    RAND_poll();
  });
}

int protocolToVersion(const std::string& protocol) {
  if (protocol == "TLSv1.2") return TLS1_2_VERSION;
  if (protocol == "TLSv1.3") return TLS1_3_VERSION;
  return 0;
}

VoidResult tlsError(const std::string& message) {
  return makeVoidError(Error(errors::kTransportError, message));
}

}  // namespace

std::string SslContext::lastError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown TLS error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return std::string(buf);
}

Result<SslContextSharedPtr> SslContext::create(const SslContextConfig& config) {
  initializeOpenSSL();

  SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
  if (!ctx) {
    return makeError<SslContextSharedPtr>(
        errors::kTransportError, "Failed to create SSL context: " + lastError());
  }

  auto result = initialize(ctx, config);
  if (isError(result)) {
    SSL_CTX_free(ctx);
    return makeError<SslContextSharedPtr>(getError(result));
  }

  return makeSuccess(
      std::shared_ptr<SslContext>(new SslContext(ctx, config)));
}

SslContext::SslContext(SSL_CTX* ctx, const SslContextConfig& config)
    : ctx_(ctx), config_(config) {}

SslContext::~SslContext() {
  if (ctx_) {
    SSL_CTX_free(ctx_);
    ctx_ = nullptr;
  }
}

SSL* SslContext::newSsl(const std::string& hostname) const {
  std::lock_guard<std::mutex> lock(ssl_mutex_);

  SSL* ssl = SSL_new(ctx_);
  if (!ssl) {
    REALMLINK_LOG(Error, "SSL_new failed: {}", lastError());
    return nullptr;
  }
  ssl_connections_created_++;
  SSL_set_connect_state(ssl);

  if (!hostname.empty()) {
    auto sni = setSniHostname(ssl, hostname);
    if (isError(sni)) {
      REALMLINK_LOG(Warning, "{}", getError(sni).message);
    }
    if (config_.verify_peer && SSL_set1_host(ssl, hostname.c_str()) != 1) {
      REALMLINK_LOG(Warning, "Failed to set verification host {}", hostname);
    }
  }
  return ssl;
}

VoidResult SslContext::setSniHostname(SSL* ssl, const std::string& hostname) {
  if (!ssl || hostname.empty()) {
    return makeVoidError(
        Error(errors::kInvalidArgument, "Invalid SSL or hostname"));
  }
  if (SSL_set_tlsext_host_name(ssl, hostname.c_str()) != 1) {
    return tlsError("Failed to set SNI hostname: " + lastError());
  }
  return makeVoidSuccess();
}

VoidResult SslContext::verifyPeer(SSL* ssl) {
  if (!ssl) {
    return makeVoidError(
        Error(errors::kInvalidArgument, "Invalid SSL connection"));
  }

  long verify_result = SSL_get_verify_result(ssl);
  if (verify_result != X509_V_OK) {
    return tlsError("Certificate verification failed: " +
                    std::string(X509_verify_cert_error_string(verify_result)));
  }

  X509* peer_cert = SSL_get1_peer_certificate(ssl);
  if (!peer_cert) {
    return tlsError("No peer certificate presented");
  }
  X509_free(peer_cert);
  return makeVoidSuccess();
}

VoidResult SslContext::initialize(SSL_CTX* ctx, const SslContextConfig& config) {
  auto result = configureProtocols(ctx, config.protocols);
  if (isError(result)) {
    return result;
  }

  result = configureCipherSuites(ctx, config.cipher_suites);
  if (isError(result)) {
    return result;
  }

  if (!config.ca_cert_file.empty()) {
    result = loadCaCertificates(ctx, config.ca_cert_file);
    if (isError(result)) {
      return result;
    }
  } else if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
    return tlsError("Failed to load system trust store: " + lastError());
  }

  result = setupVerification(ctx, config);
  if (isError(result)) {
    return result;
  }

  if (config.enable_session_resumption) {
    SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_CLIENT);
    SSL_CTX_set_timeout(ctx, config.session_timeout);
  } else {
    SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_OFF);
  }

  SSL_CTX_set_mode(ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER |
                            SSL_MODE_ENABLE_PARTIAL_WRITE);
  return makeVoidSuccess();
}

VoidResult SslContext::loadCaCertificates(SSL_CTX* ctx,
                                          const std::string& ca_file) {
  if (SSL_CTX_load_verify_locations(ctx, ca_file.c_str(), nullptr) != 1) {
    return tlsError("Failed to load CA certificates from " + ca_file + ": " +
                    lastError());
  }
  return makeVoidSuccess();
}

VoidResult SslContext::configureProtocols(
    SSL_CTX* ctx, const std::vector<std::string>& protocols) {
  if (protocols.empty()) {
    return makeVoidSuccess();
  }

  int min_version = TLS1_3_VERSION;
  int max_version = 0;
  for (const auto& protocol : protocols) {
    int version = protocolToVersion(protocol);
    if (version == 0) {
      return makeVoidError(
          Error(errors::kInvalidArgument, "Unknown protocol: " + protocol));
    }
    min_version = std::min(min_version, version);
    max_version = std::max(max_version, version);
  }

  if (SSL_CTX_set_min_proto_version(ctx, min_version) != 1) {
    return tlsError("Failed to set minimum protocol version: " + lastError());
  }
  if (SSL_CTX_set_max_proto_version(ctx, max_version) != 1) {
    return tlsError("Failed to set maximum protocol version: " + lastError());
  }
  return makeVoidSuccess();
}

VoidResult SslContext::configureCipherSuites(SSL_CTX* ctx,
                                             const std::string& ciphers) {
  if (ciphers.empty()) {
    return makeVoidSuccess();
  }
  // TLS 1.2 list only; the TLS 1.3 defaults are kept
  if (SSL_CTX_set_cipher_list(ctx, ciphers.c_str()) != 1) {
    return tlsError("Failed to set cipher suites: " + lastError());
  }
  return makeVoidSuccess();
}

VoidResult SslContext::setupVerification(SSL_CTX* ctx,
                                         const SslContextConfig& config) {
  if (config.verify_peer) {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, verifyCallback);
    SSL_CTX_set_verify_depth(ctx, 10);
  } else {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
  }
  return makeVoidSuccess();
}

int SslContext::verifyCallback(int preverify_ok, X509_STORE_CTX* ctx) {
  if (!preverify_ok) {
    int err = X509_STORE_CTX_get_error(ctx);
    REALMLINK_LOG(Warning, "Certificate rejected at depth {}: {}",
                  X509_STORE_CTX_get_error_depth(ctx),
                  X509_verify_cert_error_string(err));
    return 0;
  }
  return 1;
}

}  // namespace transport
}  // namespace realmlink
