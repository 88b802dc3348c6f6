#include "server/tls/certificate_issuer.h"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

#include <utility>

namespace fimgate {

namespace {

constexpr char kComponent[] = "tls";

std::string OpenSslError(const std::string &what) {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return what;
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  ERR_clear_error();
  return what + ": " + buffer;
}

std::string DrainBio(BIO *bio) {
  char *data = nullptr;
  long length = BIO_get_mem_data(bio, &data);
  if (length <= 0 || data == nullptr) {
    return {};
  }
  return std::string(data, static_cast<std::size_t>(length));
}

std::time_t Asn1ToTime(const ASN1_TIME *time) {
  std::tm tm{};
  if (time == nullptr || ASN1_TIME_to_tm(time, &tm) != 1) {
    return 0;
  }
  return timegm(&tm);
}

void AddExtension(X509 *certificate, int nid, const char *value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, certificate, certificate, nullptr, nullptr, 0);
  std::unique_ptr<X509_EXTENSION, decltype(&X509_EXTENSION_free)> ext(
      X509V3_EXT_conf_nid(nullptr, &ctx, nid, value), &X509_EXTENSION_free);
  if (!ext || X509_add_ext(certificate, ext.get(), -1) != 1) {
    throw CertificateGenerationError(
        OpenSslError(std::string("failed to add extension ") + OBJ_nid2sn(nid)));
  }
}

} // namespace

Certificate::Certificate(X509 *certificate, EVP_PKEY *private_key)
    : certificate_(certificate, &X509_free),
      private_key_(private_key, &EVP_PKEY_free) {}

std::string Certificate::CertificatePem() const {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()),
                                                &BIO_free);
  if (!bio || PEM_write_bio_X509(bio.get(), certificate_.get()) != 1) {
    throw CertificateGenerationError(OpenSslError("certificate PEM encoding"));
  }
  return DrainBio(bio.get());
}

std::string Certificate::PrivateKeyPem() const {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()),
                                                &BIO_free);
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), private_key_.get(), nullptr,
                                       nullptr, 0, nullptr, nullptr) != 1) {
    throw CertificateGenerationError(OpenSslError("private key PEM encoding"));
  }
  return DrainBio(bio.get());
}

std::string Certificate::CommonName() const {
  X509_NAME *subject = X509_get_subject_name(certificate_.get());
  char buffer[256] = {0};
  int length = X509_NAME_get_text_by_NID(subject, NID_commonName, buffer,
                                         sizeof(buffer));
  return length > 0 ? std::string(buffer, static_cast<std::size_t>(length))
                    : std::string();
}

long Certificate::SerialNumber() const {
  return ASN1_INTEGER_get(X509_get0_serialNumber(certificate_.get()));
}

int Certificate::KeyBits() const { return EVP_PKEY_bits(private_key_.get()); }

std::time_t Certificate::NotBefore() const {
  return Asn1ToTime(X509_get0_notBefore(certificate_.get()));
}

std::time_t Certificate::NotAfter() const {
  return Asn1ToTime(X509_get0_notAfter(certificate_.get()));
}

CertificateIssuer::CertificateIssuer(std::shared_ptr<Logger> logger)
    : CertificateIssuer(std::move(logger), Options{}) {}

CertificateIssuer::CertificateIssuer(std::shared_ptr<Logger> logger,
                                     Options options)
    : logger_(std::move(logger)), options_(std::move(options)) {}

Certificate CertificateIssuer::IssueSelfSigned() const {
  // RSA key pair.
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> key_ctx(
      EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
  if (!key_ctx || EVP_PKEY_keygen_init(key_ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(key_ctx.get(), options_.key_bits) != 1) {
    throw CertificateGenerationError(OpenSslError("RSA keygen setup failed"));
  }
  EVP_PKEY *raw_key = nullptr;
  if (EVP_PKEY_keygen(key_ctx.get(), &raw_key) != 1 || raw_key == nullptr) {
    throw CertificateGenerationError(OpenSslError("RSA key generation failed"));
  }
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw_key,
                                                          &EVP_PKEY_free);

  std::unique_ptr<X509, decltype(&X509_free)> certificate(X509_new(),
                                                          &X509_free);
  if (!certificate) {
    throw CertificateGenerationError(OpenSslError("X509_new failed"));
  }
  if (X509_set_version(certificate.get(), 2) != 1 ||
      ASN1_INTEGER_set(X509_get_serialNumber(certificate.get()),
                       options_.serial) != 1) {
    throw CertificateGenerationError(OpenSslError("certificate header"));
  }

  // Validity: now .. now + N calendar years.
  std::time_t now = std::time(nullptr);
  std::tm expiry{};
  gmtime_r(&now, &expiry);
  expiry.tm_year += options_.validity_years;
  std::time_t not_after = timegm(&expiry);
  if (ASN1_TIME_set(X509_getm_notBefore(certificate.get()), now) == nullptr ||
      ASN1_TIME_set(X509_getm_notAfter(certificate.get()), not_after) ==
          nullptr) {
    throw CertificateGenerationError(OpenSslError("certificate validity"));
  }

  // Self-signed: issuer == subject.
  X509_NAME *name = X509_get_subject_name(certificate.get());
  if (X509_NAME_add_entry_by_txt(
          name, "CN", MBSTRING_ASC,
          reinterpret_cast<const unsigned char *>(options_.common_name.c_str()),
          -1, -1, 0) != 1 ||
      X509_set_issuer_name(certificate.get(), name) != 1 ||
      X509_set_pubkey(certificate.get(), key.get()) != 1) {
    throw CertificateGenerationError(OpenSslError("certificate subject"));
  }

  AddExtension(certificate.get(), NID_basic_constraints, "critical,CA:FALSE");
  AddExtension(certificate.get(), NID_key_usage,
               "critical,digitalSignature,keyEncipherment,keyCertSign");
  AddExtension(certificate.get(), NID_ext_key_usage, "serverAuth");

  if (X509_sign(certificate.get(), key.get(), EVP_sha256()) <= 0) {
    throw CertificateGenerationError(OpenSslError("certificate signing failed"));
  }

  Certificate issued(certificate.release(), key.release());
  if (logger_) {
    logger_->Info(kComponent, "issued self-signed certificate",
                  "cn=" + issued.CommonName() +
                      " bits=" + std::to_string(issued.KeyBits()) +
                      " not_after=" + std::to_string(issued.NotAfter()));
  }
  return issued;
}

} // namespace fimgate
