#include "SMIME.hpp"

#include <algorithm>
#include <ctime>

#include <boost/algorithm/string/predicate.hpp>

#include <glog/logging.h>

namespace {
// Now can't hold dates past 2262, so render these separately.
std::string utc_string(CMS::certificate::time_point tp)
{
  auto const t = static_cast<time_t>(tp.time_since_epoch().count());
  tm         tm_utc{};
  if (!gmtime_r(&t, &tm_utc))
    return std::to_string(t);
  char bfr[32];
  auto const len = strftime(bfr, sizeof bfr, "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return std::string(bfr, len);
}
} // namespace

namespace SMIME {

char const* to_string(result_code code)
{
  switch (code) {
  case result_code::verification_ok: return "VERIFICATION_OK";
  case result_code::cannot_verify: return "CANNOT_VERIFY";
  case result_code::fraud_warning: return "FRAUD_WARNING";
  }
  LOG(FATAL) << "unknown result_code " << static_cast<int>(code);
  return "";
}

bool is_signed_envelope(MIME::node const& root, MIME::node_ref signature)
{
  if (root.content_type.value() != root_content_type)
    return false;

  auto const proto = root.content_type.param("protocol");
  if (!proto || *proto != protocol) {
    LOG(INFO) << "multipart/signed with protocol «" << proto.value_or("")
              << "»";
    return false;
  }

  auto const micalg = root.content_type.param("micalg");
  if (!micalg ||
      std::none_of(begin(micalgs), end(micalgs), [&micalg](char const* alg) {
        return boost::iequals(*micalg, alg);
      })) {
    LOG(INFO) << "multipart/signed with micalg «" << micalg.value_or("")
              << "»";
    return false;
  }

  if (root.children.empty() || !signature)
    return false;

  auto const sig_type = signature->get().content_type.value();
  return std::find(begin(signature_content_types),
                   end(signature_content_types),
                   sig_type) != end(signature_content_types);
}

bool certificates_current(CMS::signed_data const& envelope,
                          Now const&              now,
                          std::chrono::hours      margin)
{
  auto const t = std::chrono::floor<std::chrono::seconds>(now.value());
  for (auto const& cert : envelope.certificates()) {
    if (t < cert.not_before() - margin) {
      LOG(WARNING) << "certificate " << cert.serial() << " not valid before "
                   << utc_string(cert.not_before()) << ", now " << now;
      return false;
    }
    if (t > cert.not_after() + margin) {
      LOG(WARNING) << "certificate " << cert.serial() << " expired "
                   << utc_string(cert.not_after()) << ", now " << now;
      return false;
    }
  }
  return true;
}

std::optional<std::string> signer_email(CMS::signed_data const& envelope)
{
  if (envelope.certificates().empty())
    return {};
  return envelope.certificates().front().subject_attribute(
      CMS::email_address_oid);
}

bool from_matches(std::vector<MIME::name_addr> const& from,
                  std::string_view                    signer)
{
  return !from.empty() && from.front().addr == signer;
}

} // namespace SMIME
