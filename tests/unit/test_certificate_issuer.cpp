#include <catch2/catch_test_macros.hpp>

#include "server/tls/certificate_issuer.h"
#include "test_support.h"

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <sys/socket.h>
#include <unistd.h>

using fimgate::testing::CapturedLog;

TEST_CASE("Self-signed certificate carries the expected identity", "[tls]") {
  CapturedLog log;
  fimgate::CertificateIssuer issuer(log.logger);
  auto cert = issuer.IssueSelfSigned();

  REQUIRE(cert.CommonName() == "localhost");
  REQUIRE(cert.SerialNumber() == 1);
  REQUIRE(cert.KeyBits() == 2048);

  long long span = static_cast<long long>(cert.NotAfter()) -
                   static_cast<long long>(cert.NotBefore());
  const long long thirty_years = 30LL * 365 * 24 * 3600;
  REQUIRE(span >= thirty_years);
  REQUIRE(span <= thirty_years + 10LL * 24 * 3600);
  REQUIRE(cert.NotBefore() <= std::time(nullptr) + 5);

  REQUIRE(X509_verify(cert.x509(), cert.private_key()) == 1);
  REQUIRE(X509_check_private_key(cert.x509(), cert.private_key()) == 1);
}

TEST_CASE("Certificate carries server key usages", "[tls]") {
  CapturedLog log;
  auto cert = fimgate::CertificateIssuer(log.logger).IssueSelfSigned();
  uint32_t usage = X509_get_key_usage(cert.x509());
  REQUIRE((usage & KU_DIGITAL_SIGNATURE) != 0);
  REQUIRE((usage & KU_KEY_ENCIPHERMENT) != 0);
  REQUIRE((usage & KU_KEY_CERT_SIGN) != 0);
  REQUIRE((X509_get_extended_key_usage(cert.x509()) & XKU_SSL_SERVER) != 0);
}

TEST_CASE("Certificate encodes to PEM", "[tls]") {
  CapturedLog log;
  auto cert = fimgate::CertificateIssuer(log.logger).IssueSelfSigned();
  REQUIRE(cert.CertificatePem().rfind("-----BEGIN CERTIFICATE-----", 0) == 0);
  REQUIRE(cert.PrivateKeyPem().find("PRIVATE KEY-----") != std::string::npos);
}

TEST_CASE("Issuer options override the defaults", "[tls]") {
  CapturedLog log;
  fimgate::CertificateIssuer::Options options;
  options.common_name = "fimgate.test";
  options.serial = 42;
  options.validity_years = 1;
  auto cert = fimgate::CertificateIssuer(log.logger, options).IssueSelfSigned();
  REQUIRE(cert.CommonName() == "fimgate.test");
  REQUIRE(cert.SerialNumber() == 42);
  REQUIRE(cert.NotAfter() - cert.NotBefore() < 400LL * 24 * 3600);
}

TEST_CASE("Invalid key size raises CertificateGenerationError", "[tls]") {
  CapturedLog log;
  fimgate::CertificateIssuer::Options options;
  options.key_bits = 0;
  fimgate::CertificateIssuer issuer(log.logger, options);
  REQUIRE_THROWS_AS(issuer.IssueSelfSigned(), fimgate::CertificateGenerationError);
}

TEST_CASE("Issued certificate completes a TLS 1.3 handshake", "[tls]") {
  CapturedLog log;
  auto cert = fimgate::CertificateIssuer(log.logger).IssueSelfSigned();

  std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> server_ctx(
      SSL_CTX_new(TLS_server_method()), SSL_CTX_free);
  std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> client_ctx(
      SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
  REQUIRE(server_ctx);
  REQUIRE(client_ctx);
  SSL_CTX_set_min_proto_version(server_ctx.get(), TLS1_3_VERSION);
  REQUIRE(SSL_CTX_use_certificate(server_ctx.get(), cert.x509()) == 1);
  REQUIRE(SSL_CTX_use_PrivateKey(server_ctx.get(), cert.private_key()) == 1);
  SSL_CTX_set_verify(client_ctx.get(), SSL_VERIFY_NONE, nullptr);

  int fds[2];
  REQUIRE(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  int server_result = 0;
  std::thread server([&]() {
    SSL *ssl = SSL_new(server_ctx.get());
    SSL_set_fd(ssl, fds[0]);
    server_result = SSL_accept(ssl);
    if (server_result == 1) {
      SSL_write(ssl, "ok", 2);
    }
    SSL_free(ssl);
  });

  SSL *ssl = SSL_new(client_ctx.get());
  SSL_set_fd(ssl, fds[1]);
  int client_result = SSL_connect(ssl);
  char buf[4] = {0};
  int n = client_result == 1 ? SSL_read(ssl, buf, sizeof(buf)) : 0;
  std::string version = SSL_get_version(ssl);
  X509 *peer = SSL_get1_peer_certificate(ssl);
  SSL_free(ssl);
  server.join();
  ::close(fds[0]);
  ::close(fds[1]);

  REQUIRE(client_result == 1);
  REQUIRE(server_result == 1);
  REQUIRE(version == "TLSv1.3");
  REQUIRE(std::string(buf, n > 0 ? n : 0) == "ok");
  REQUIRE(peer != nullptr);
  REQUIRE(X509_cmp(peer, cert.x509()) == 0);
  X509_free(peer);
}
