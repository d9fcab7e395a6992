/**
 * @file ssl_context.h
 * @brief Client TLS context shared by all secure game connections
 *
 * One context is created at startup from the TLS settings of the
 * application config and shared by every wss:// connection. Each connection
 * takes its own SSL object from it with newSsl().
 */

#ifndef REALMLINK_TRANSPORT_SSL_CONTEXT_H
#define REALMLINK_TRANSPORT_SSL_CONTEXT_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "realmlink/core/result.h"

// Forward declare OpenSSL types to avoid exposing OpenSSL headers
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;
typedef struct x509_store_ctx_st X509_STORE_CTX;

namespace realmlink {
namespace transport {

class SslContext;
using SslContextSharedPtr = std::shared_ptr<SslContext>;

struct SslContextConfig {
  // CA bundle; empty means the system trust store
  std::string ca_cert_file;

  bool verify_peer{true};

  std::vector<std::string> protocols{"TLSv1.2", "TLSv1.3"};
  // Empty keeps the OpenSSL default cipher list
  std::string cipher_suites;

  bool enable_session_resumption{true};
  uint32_t session_timeout{300};  // seconds
};

/**
 * OpenSSL client context. Immutable after creation and safe to share.
 */
class SslContext {
 public:
  static Result<SslContextSharedPtr> create(const SslContextConfig& config);

  ~SslContext();

  /**
   * New client SSL object for one connection, with SNI and host name
   * verification set to the given host. Caller owns the result; nullptr on
   * failure.
   */
  SSL* newSsl(const std::string& hostname) const;

  SSL_CTX* getNativeContext() const { return ctx_; }

  const SslContextConfig& getConfig() const { return config_; }

  uint64_t connectionsCreated() const { return ssl_connections_created_; }

  static VoidResult setSniHostname(SSL* ssl, const std::string& hostname);

  // Check the verification outcome after the handshake
  static VoidResult verifyPeer(SSL* ssl);

  // Drain the OpenSSL error queue into a message
  static std::string lastError();

 private:
  SslContext(SSL_CTX* ctx, const SslContextConfig& config);

  static VoidResult initialize(SSL_CTX* ctx, const SslContextConfig& config);
  static VoidResult loadCaCertificates(SSL_CTX* ctx, const std::string& ca_file);
  static VoidResult configureProtocols(SSL_CTX* ctx,
                                       const std::vector<std::string>& protocols);
  static VoidResult configureCipherSuites(SSL_CTX* ctx,
                                          const std::string& ciphers);
  static VoidResult setupVerification(SSL_CTX* ctx,
                                      const SslContextConfig& config);
  static int verifyCallback(int preverify_ok, X509_STORE_CTX* ctx);

  SSL_CTX* ctx_;
  SslContextConfig config_;
  mutable std::mutex ssl_mutex_;
  mutable std::atomic<uint64_t> ssl_connections_created_{0};

  SslContext(const SslContext&) = delete;
  SslContext& operator=(const SslContext&) = delete;
};

}  // namespace transport
}  // namespace realmlink

#endif  // REALMLINK_TRANSPORT_SSL_CONTEXT_H
