#include "OCSP.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/ocsp.h>
#include <openssl/x509v3.h>

#include <glog/logging.h>

namespace {
struct ocsp_request_free {
  void operator()(OCSP_REQUEST* req) const { OCSP_REQUEST_free(req); }
};
} // namespace

namespace OCSP {

std::string request(CMS::certificate const& cert,
                    CMS::certificate const& issuer,
                    bool                    nonce)
{
  ERR_clear_error();

  std::unique_ptr<OCSP_REQUEST, ocsp_request_free> req{OCSP_REQUEST_new()};
  if (!req)
    throw std::runtime_error("OCSP_REQUEST_new failed");

  auto const id = OCSP_cert_to_id(EVP_sha1(), cert.x509(), issuer.x509());
  if (!id) {
    CMS::log_openssl_errors("OCSP_cert_to_id");
    throw std::invalid_argument("can't form OCSP CertID");
  }
  if (!OCSP_request_add0_id(req.get(), id)) {
    OCSP_CERTID_free(id);
    CMS::log_openssl_errors("OCSP_request_add0_id");
    throw std::runtime_error("OCSP_request_add0_id failed");
  }

  if (nonce && OCSP_request_add1_nonce(req.get(), nullptr, -1) != 1) {
    CMS::log_openssl_errors("OCSP_request_add1_nonce");
    throw std::runtime_error("OCSP_request_add1_nonce failed");
  }

  unsigned char* der = nullptr;
  auto const     len = i2d_OCSP_REQUEST(req.get(), &der);
  if (len < 0) {
    CMS::log_openssl_errors("i2d_OCSP_REQUEST");
    throw std::runtime_error("i2d_OCSP_REQUEST failed");
  }
  std::string ret(reinterpret_cast<char const*>(der), len);
  OPENSSL_free(der);

  LOG(INFO) << "OCSP request for serial " << cert.serial() << ", "
            << ret.size() << " octets";
  return ret;
}

CMS::certificate const* find_issuer(CMS::certificate const&              cert,
                                    std::vector<CMS::certificate> const& certs)
{
  for (auto const& candidate : certs) {
    if (X509_check_issued(candidate.x509(), cert.x509()) == X509_V_OK)
      return &candidate;
  }
  if (X509_check_issued(cert.x509(), cert.x509()) == X509_V_OK)
    return &cert;
  return nullptr;
}

} // namespace OCSP
