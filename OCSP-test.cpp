#include "OCSP.hpp"

#include "Decode.hpp"
#include "SMIME-test-data.hpp"

#include <openssl/ocsp.h>

#include <glog/logging.h>

namespace {
struct parsed_request {
  explicit parsed_request(std::string const& der)
  {
    auto p = reinterpret_cast<unsigned char const*>(der.data());
    req_   = d2i_OCSP_REQUEST(nullptr, &p, static_cast<long>(der.size()));
    CHECK_NOTNULL(req_);
  }
  ~parsed_request() { OCSP_REQUEST_free(req_); }

  parsed_request(parsed_request const&)            = delete;
  parsed_request& operator=(parsed_request const&) = delete;

  OCSP_REQUEST* req_;
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CMS::signed_data alice{Decode::base64(test_data::alice_signature)};
  CMS::signed_data bob{Decode::base64(test_data::bob_signature_noattr)};

  auto const& alice_cert = alice.certificates()[0];
  auto const& bob_cert   = bob.certificates()[0];

  // self-signed
  CHECK_EQ(OCSP::find_issuer(alice_cert, alice.certificates()), &alice_cert);
  CHECK_EQ(OCSP::find_issuer(alice_cert, bob.certificates()), &alice_cert);
  CHECK(OCSP::find_issuer(alice_cert, {}) == &alice_cert);

  auto const der = OCSP::request(alice_cert, alice_cert);
  CHECK(!der.empty());

  parsed_request req{der};
  CHECK_EQ(OCSP_request_onereq_count(req.req_), 1);
  CHECK_GE(OCSP_REQUEST_get_ext_by_NID(req.req_, NID_id_pkix_OCSP_Nonce, -1), 0);

  auto const id = OCSP_onereq_get0_id(OCSP_request_onereq_get0(req.req_, 0));
  ASN1_INTEGER* serial = nullptr;
  ASN1_OBJECT*  md     = nullptr;
  CHECK_EQ(OCSP_id_get0_info(nullptr, &md, nullptr, &serial, id), 1);
  CHECK_EQ(ASN1_INTEGER_get(serial), 0x1001);
  CHECK_EQ(OBJ_obj2nid(md), NID_sha1);

  // a fresh nonce per call
  CHECK_NE(OCSP::request(alice_cert, alice_cert), der);

  // without a nonce the request is a function of its inputs
  auto const plain = OCSP::request(bob_cert, bob_cert, false);
  CHECK_EQ(plain, OCSP::request(bob_cert, bob_cert, false));
  parsed_request plain_req{plain};
  CHECK_LT(OCSP_REQUEST_get_ext_by_NID(plain_req.req_, NID_id_pkix_OCSP_Nonce, -1), 0);
}
