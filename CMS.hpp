#ifndef CMS_DOT_HPP
#define CMS_DOT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/cms.h>
#include <openssl/x509.h>

namespace CMS {

// The ASN.1/BER or the CMS structure is broken.
struct decode_error : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// The signature could not be evaluated either way: unknown algorithm,
// missing signer certificate, unusable key.
struct verify_error : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Drain this thread's OpenSSL error queue into the log.
void log_openssl_errors(char const* what);

// PKCS #9 emailAddress
auto constexpr email_address_oid = "1.2.840.113549.1.9.1";

struct attribute {
  std::string oid;   // dotted decimal
  std::string name;  // short name, "CN", "emailAddress"; empty if unknown
  std::string value; // UTF-8
};

class certificate {
public:
  // Seconds, so dates out to 9999-12-31 fit.
  using time_point = std::chrono::sys_seconds;

  // Takes its own reference to x509.
  explicit certificate(X509* x509);

  std::vector<attribute> const& subject() const { return subject_; }

  // Value of the first subject attribute of the given type.
  std::optional<std::string> subject_attribute(std::string_view oid) const;

  time_point not_before() const { return not_before_; }
  time_point not_after() const { return not_after_; }

  std::string const& serial() const { return serial_; }
  std::string const& issuer() const { return issuer_; }

  X509* x509() const { return x509_.get(); }

private:
  struct x509_free {
    void operator()(X509* x) const { X509_free(x); }
  };

  std::unique_ptr<X509, x509_free> x509_;

  std::vector<attribute> subject_;
  time_point             not_before_;
  time_point             not_after_;
  std::string            serial_; // upper case hex
  std::string            issuer_; // RFC 2253
};

class signed_data {
public:
  // DER or BER encoded ContentInfo that must wrap a SignedData and
  // account for every octet of the input; throws decode_error.
  explicit signed_data(std::string_view ber);

  std::vector<certificate> const& certificates() const
  {
    return certificates_;
  }

  // Short names ("SHA256") of the digest algorithms of the signers.
  std::vector<std::string> const& digest_algorithms() const
  {
    return digest_algorithms_;
  }

  int signer_count() const;

  // Check one signer against detached content.  True on a match, false
  // on a mismatch, throws verify_error when neither can be determined.
  bool verify(int signer, std::string_view content);

private:
  struct cms_free {
    void operator()(CMS_ContentInfo* cms) const { CMS_ContentInfo_free(cms); }
  };

  std::unique_ptr<CMS_ContentInfo, cms_free> cms_;

  std::vector<certificate> certificates_;
  std::vector<std::string> digest_algorithms_;
};

} // namespace CMS

#endif // CMS_DOT_HPP
