#pragma once

#include "server/logging/logger.h"

#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace fimgate {

class CertificateGenerationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// X.509 certificate plus its private key. Copies share the underlying OpenSSL
// objects, which are never mutated after issuance.
class Certificate {
 public:
  // Takes ownership of both pointers.
  Certificate(X509 *certificate, EVP_PKEY *private_key);

  X509 *x509() const { return certificate_.get(); }
  EVP_PKEY *private_key() const { return private_key_.get(); }

  std::string CertificatePem() const;
  std::string PrivateKeyPem() const;
  std::string CommonName() const;
  long SerialNumber() const;
  int KeyBits() const;
  std::time_t NotBefore() const;
  std::time_t NotAfter() const;

 private:
  std::shared_ptr<X509> certificate_;
  std::shared_ptr<EVP_PKEY> private_key_;
};

// Manufactures an ephemeral self-signed server certificate when no PEM pair is
// configured. Nothing is written to disk.
class CertificateIssuer {
 public:
  struct Options {
    std::string common_name{"localhost"};
    int key_bits{2048};
    int validity_years{30};
    long serial{1};
  };

  explicit CertificateIssuer(std::shared_ptr<Logger> logger);
  CertificateIssuer(std::shared_ptr<Logger> logger, Options options);

  // Throws CertificateGenerationError on any key-generation, signing or
  // encoding failure.
  Certificate IssueSelfSigned() const;

 private:
  std::shared_ptr<Logger> logger_;
  Options options_;
};

} // namespace fimgate
