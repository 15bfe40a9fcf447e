#include "CMS.hpp"

#include <algorithm>
#include <climits>
#include <ctime>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/objects.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {

using CMS::log_openssl_errors;

struct bio_free_all {
  void operator()(BIO* bio) const { BIO_free_all(bio); }
};

using bio_ptr = std::unique_ptr<BIO, bio_free_all>;

std::string obj_txt(ASN1_OBJECT const* obj)
{
  char bfr[128];
  auto const len = OBJ_obj2txt(bfr, sizeof bfr, obj, 1);
  if (len <= 0)
    return "";
  return std::string(bfr, std::min<size_t>(len, sizeof(bfr) - 1));
}

std::string obj_short_name(ASN1_OBJECT const* obj)
{
  auto const nid = OBJ_obj2nid(obj);
  if (nid == NID_undef)
    return "";
  auto const sn = OBJ_nid2sn(nid);
  return sn ? sn : "";
}

CMS::certificate::time_point asn1_time(ASN1_TIME const* t, char const* which)
{
  tm tm_utc{};
  if (!t || ASN1_TIME_to_tm(t, &tm_utc) != 1) {
    log_openssl_errors(which);
    throw CMS::decode_error(fmt::format("bad certificate {}", which));
  }
  return CMS::certificate::time_point{std::chrono::seconds{timegm(&tm_utc)}};
}

std::string serial_hex(X509* x509)
{
  auto const bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(x509), nullptr);
  if (!bn) {
    log_openssl_errors("serialNumber");
    throw CMS::decode_error("bad certificate serialNumber");
  }
  auto const hex = BN_bn2hex(bn);
  BN_free(bn);
  if (!hex)
    throw std::runtime_error("BN_bn2hex failed");
  std::string ret{hex};
  OPENSSL_free(hex);
  return ret;
}

std::string name_rfc2253(X509_NAME const* name)
{
  bio_ptr bio{BIO_new(BIO_s_mem())};
  if (!bio)
    throw std::runtime_error("BIO_new failed");
  if (X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
    log_openssl_errors("X509_NAME_print_ex");
    throw CMS::decode_error("bad certificate name");
  }
  char* data      = nullptr;
  auto const len  = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, len > 0 ? static_cast<size_t>(len) : 0u);
}

} // namespace

namespace CMS {

void log_openssl_errors(char const* what)
{
  unsigned long err;
  while ((err = ERR_get_error()) != 0) {
    char bfr[256];
    ERR_error_string_n(err, bfr, sizeof bfr);
    LOG(WARNING) << what << ": " << bfr;
  }
}

certificate::certificate(X509* x509)
{
  CHECK_NOTNULL(x509);
  CHECK_EQ(X509_up_ref(x509), 1);
  x509_.reset(x509);

  auto const subj = X509_get_subject_name(x509);
  for (int i = 0; i < X509_NAME_entry_count(subj); ++i) {
    auto const entry = X509_NAME_get_entry(subj, i);
    auto const obj   = X509_NAME_ENTRY_get_object(entry);

    unsigned char* utf8 = nullptr;
    auto const     len  = ASN1_STRING_to_UTF8(&utf8, X509_NAME_ENTRY_get_data(entry));
    if (len < 0) {
      log_openssl_errors("ASN1_STRING_to_UTF8");
      throw decode_error("bad subject attribute value");
    }
    std::string value(reinterpret_cast<char const*>(utf8), len);
    OPENSSL_free(utf8);

    subject_.push_back({obj_txt(obj), obj_short_name(obj), std::move(value)});
  }

  not_before_ = asn1_time(X509_get0_notBefore(x509), "notBefore");
  not_after_  = asn1_time(X509_get0_notAfter(x509), "notAfter");
  serial_     = serial_hex(x509);
  issuer_     = name_rfc2253(X509_get_issuer_name(x509));
}

std::optional<std::string>
certificate::subject_attribute(std::string_view oid) const
{
  for (auto const& attr : subject_) {
    if (attr.oid == oid)
      return attr.value;
  }
  return {};
}

//.............................................................................

signed_data::signed_data(std::string_view ber)
{
  ERR_clear_error();

  if (ber.empty())
    throw decode_error("empty signature");
  if (ber.size() > LONG_MAX)
    throw decode_error("signature too large");

  auto       p       = reinterpret_cast<unsigned char const*>(ber.data());
  auto const ber_end = p + ber.size();

  cms_.reset(d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(ber.size())));
  if (!cms_) {
    log_openssl_errors("d2i_CMS_ContentInfo");
    throw decode_error("not a CMS ContentInfo");
  }
  if (p != ber_end) {
    throw decode_error(
        fmt::format("{} octets after the ContentInfo", ber_end - p));
  }

  if (OBJ_obj2nid(CMS_get0_type(cms_.get())) != NID_pkcs7_signed) {
    throw decode_error(fmt::format("ContentInfo type {} is not SignedData",
                                   obj_txt(CMS_get0_type(cms_.get()))));
  }

  // A new stack holding new references, or null if there are none.
  if (auto const certs = CMS_get1_certs(cms_.get()); certs) {
    try {
      for (int i = 0; i < sk_X509_num(certs); ++i) {
        certificates_.emplace_back(sk_X509_value(certs, i));
      }
    }
    catch (...) {
      sk_X509_pop_free(certs, X509_free);
      throw;
    }
    sk_X509_pop_free(certs, X509_free);
  }

  auto const sinfos = CMS_get0_SignerInfos(cms_.get());
  for (int i = 0; sinfos && i < sk_CMS_SignerInfo_num(sinfos); ++i) {
    X509_ALGOR* dig = nullptr;
    CMS_SignerInfo_get0_algs(sk_CMS_SignerInfo_value(sinfos, i), nullptr,
                             nullptr, &dig, nullptr);
    if (!dig)
      continue;
    ASN1_OBJECT const* alg = nullptr;
    X509_ALGOR_get0(&alg, nullptr, nullptr, dig);
    auto name = obj_short_name(alg);
    if (name.empty())
      name = obj_txt(alg);
    if (std::find(std::begin(digest_algorithms_), std::end(digest_algorithms_),
                  name) == std::end(digest_algorithms_)) {
      digest_algorithms_.push_back(std::move(name));
    }
  }

  LOG(INFO) << "SignedData with " << certificates_.size()
            << " certificate(s), " << signer_count() << " signer(s)";
}

int signed_data::signer_count() const
{
  auto const sinfos = CMS_get0_SignerInfos(cms_.get());
  return sinfos ? sk_CMS_SignerInfo_num(sinfos) : 0;
}

bool signed_data::verify(int signer, std::string_view content)
{
  ERR_clear_error();

  auto const sinfos = CMS_get0_SignerInfos(cms_.get());
  if (!sinfos || signer < 0 || signer >= sk_CMS_SignerInfo_num(sinfos))
    throw verify_error(fmt::format("no signer {}", signer));

  auto const si = sk_CMS_SignerInfo_value(sinfos, signer);

  // Match the certificates carried in the message to the signers.
  if (CMS_set1_signers_certs(cms_.get(), nullptr, 0) < 0) {
    log_openssl_errors("CMS_set1_signers_certs");
    throw verify_error("can't match signer certificates");
  }

  X509* signer_cert = nullptr;
  CMS_SignerInfo_get0_algs(si, nullptr, &signer_cert, nullptr, nullptr);
  if (!signer_cert)
    throw verify_error("signer certificate not in message");

  // With signed attributes, the signature covers them and they carry
  // the messageDigest of the content; without, it covers the content.
  if (CMS_signed_get_attr_count(si) >= 0) {
    auto const r = CMS_SignerInfo_verify(si);
    if (r < 0) {
      log_openssl_errors("CMS_SignerInfo_verify");
      throw verify_error("can't check signature on signed attributes");
    }
    if (r == 0) {
      log_openssl_errors("CMS_SignerInfo_verify");
      LOG(WARNING) << "signature on signed attributes does not verify";
      return false;
    }
  }

  if (content.size() > INT_MAX)
    throw verify_error("content too large");

  auto const dcont =
      BIO_new_mem_buf(content.data(), static_cast<int>(content.size()));
  if (!dcont)
    throw std::runtime_error("BIO_new_mem_buf failed");

  bio_ptr chain{CMS_dataInit(cms_.get(), dcont)};
  if (!chain) {
    BIO_free(dcont);
    log_openssl_errors("CMS_dataInit");
    throw verify_error("can't digest content");
  }

  char bfr[4096];
  while (BIO_read(chain.get(), bfr, sizeof bfr) > 0)
    ;

  auto const r = CMS_SignerInfo_verify_content(si, chain.get());
  if (r < 0) {
    log_openssl_errors("CMS_SignerInfo_verify_content");
    throw verify_error("can't check content digest");
  }
  if (r == 0) {
    log_openssl_errors("CMS_SignerInfo_verify_content");
    LOG(WARNING) << "content digest does not match signature";
    return false;
  }

  return true;
}

} // namespace CMS
