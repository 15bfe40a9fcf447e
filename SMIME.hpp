#ifndef SMIME_DOT_HPP
#define SMIME_DOT_HPP

#include <array>
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "CMS.hpp"
#include "MIME.hpp"
#include "Now.hpp"

// S/MIME signed message checks, RFC 8551 section 3.5.3.

namespace SMIME {

auto constexpr root_content_type = "multipart/signed";
auto constexpr protocol          = "application/pkcs7-signature";

// Accepted micalg values, compared without regard to case.
constexpr std::array<char const*, 7> micalgs{
    "md5", "sha-1", "sha-224", "sha-256", "sha-384", "sha-512", "unknown",
};

constexpr std::array<char const*, 2> signature_content_types{
    "application/x-pkcs7-signature",
    "application/pkcs7-signature",
};

// Node paths within a multipart/signed message.
auto constexpr signed_body_path = "1";
auto constexpr signature_path   = "2";

std::chrono::hours constexpr default_margin{2};

enum class result_code {
  verification_ok,
  cannot_verify,
  fraud_warning,
};

char const* to_string(result_code code);

inline std::ostream& operator<<(std::ostream& os, result_code code)
{
  return os << to_string(code);
}

struct result {
  std::string mail_id;
  bool        success{false};
  result_code code{result_code::cannot_verify};
  std::string message;
  std::string signer;

  bool operator==(result const& that) const
  {
    return mail_id == that.mail_id && success == that.success &&
           code == that.code && message == that.message &&
           signer == that.signer;
  }
  bool operator!=(result const& that) const { return !(*this == that); }
};

struct config {
  std::chrono::hours margin{default_margin};
};

// User facing text for each outcome.
namespace messages {
auto constexpr not_signed        = "Message is not digitally signed.";
auto constexpr invalid_signature = "Fraud warning: Invalid digital signature.";
auto constexpr certificate_expired =
    "The signature's certificate has expired. Be wary of message content.";
auto constexpr failed_verification =
    "Fraud warning: Message failed verification with signature.";
auto constexpr from_mismatch =
    "Fraud warning: The \"From\" email address does not match the "
    "signature's email address.";
auto constexpr valid =
    "Message includes a valid digital signature for the sender.";
auto constexpr unknown_error = "Message cannot be verified: Unknown error.";
} // namespace messages

// The multipart/signed shape: root type, protocol and micalg
// parameters, children, and the type of the signature part.
bool is_signed_envelope(MIME::node const& root, MIME::node_ref signature);

// Every certificate's validity period, widened by margin on both ends,
// contains now.
bool certificates_current(CMS::signed_data const& envelope,
                          Now const&              now,
                          std::chrono::hours      margin);

// The emailAddress subject attribute of the first certificate.
std::optional<std::string> signer_email(CMS::signed_data const& envelope);

// The first From address equals signer, exactly.
bool from_matches(std::vector<MIME::name_addr> const& from,
                  std::string_view                    signer);

} // namespace SMIME

#endif // SMIME_DOT_HPP
