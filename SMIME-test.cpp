#include "SMIME.hpp"

#include "Decode.hpp"
#include "SMIME-test-data.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
bool envelope_ok(std::string_view message)
{
  MIME::parsed msg;
  msg.parse(message);
  return SMIME::is_signed_envelope(msg.root(),
                                   msg.get_node(SMIME::signature_path));
}

std::string with_content_type(std::string_view ct, std::string_view sig_ct)
{
  return fmt::format("From: alice@example.com\r\n"
                     "Content-Type: {}\r\n"
                     "\r\n"
                     "--b\r\n"
                     "\r\n"
                     "body\r\n"
                     "--b\r\n"
                     "Content-Type: {}\r\n"
                     "\r\n"
                     "MIIB\r\n"
                     "--b--\r\n",
                     ct, sig_ct);
}

Now at(long sec) { return Now{Now::time_point{std::chrono::seconds{sec}}}; }
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(std::string(SMIME::to_string(SMIME::result_code::verification_ok)),
           "VERIFICATION_OK");
  CHECK_EQ(std::string(SMIME::to_string(SMIME::result_code::cannot_verify)),
           "CANNOT_VERIFY");
  CHECK_EQ(std::string(SMIME::to_string(SMIME::result_code::fraud_warning)),
           "FRAUD_WARNING");

  auto constexpr pkcs7   = "application/pkcs7-signature";
  auto constexpr x_pkcs7 = "application/x-pkcs7-signature";

  // envelope shape
  CHECK(envelope_ok(test_data::signed_message("alice@example.com",
                                              test_data::alice_signature)));
  CHECK(envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/pkcs7-signature\"; "
      "micalg=SHA-256; boundary=b",
      pkcs7)));
  CHECK(envelope_ok(with_content_type(
      "Multipart/Signed; protocol=\"application/pkcs7-signature\"; "
      "micalg=unknown; boundary=b",
      x_pkcs7)));
  CHECK(envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/pkcs7-signature\"; "
      "micalg=md5; boundary=b",
      "Application/PKCS7-Signature; name=smime.p7s")));

  // protocol must match exactly
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/x-pkcs7-signature\"; "
      "micalg=sha-256; boundary=b",
      pkcs7)));
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; protocol=\"Application/PKCS7-Signature\"; "
      "micalg=sha-256; boundary=b",
      pkcs7)));
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; micalg=sha-256; boundary=b", pkcs7)));

  // micalg from the fixed set only
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/pkcs7-signature\"; "
      "micalg=sha256; boundary=b",
      pkcs7)));
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/pkcs7-signature\"; "
      "boundary=b",
      pkcs7)));

  // wrong signature part type
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/pkcs7-signature\"; "
      "micalg=sha-256; boundary=b",
      "application/pgp-signature")));
  CHECK(!envelope_ok(with_content_type(
      "multipart/signed; protocol=\"application/pkcs7-signature\"; "
      "micalg=sha-256; boundary=b",
      "application/pkcs7-mime")));

  // not multipart/signed
  CHECK(!envelope_ok(with_content_type(
      "multipart/mixed; protocol=\"application/pkcs7-signature\"; "
      "micalg=sha-256; boundary=b",
      pkcs7)));
  CHECK(!envelope_ok("From: alice@example.com\r\n\r\nplain text\r\n"));
  CHECK(!envelope_ok(""));

  // no second part
  CHECK(!envelope_ok("Content-Type: multipart/signed; "
                     "protocol=\"application/pkcs7-signature\"; "
                     "micalg=sha-256; boundary=b\r\n"
                     "\r\n"
                     "--b\r\n"
                     "\r\n"
                     "body\r\n"
                     "--b--\r\n"));

  // no parts at all
  CHECK(!envelope_ok("Content-Type: multipart/signed; "
                     "protocol=\"application/pkcs7-signature\"; "
                     "micalg=sha-256; boundary=b\r\n"
                     "\r\n"
                     "no delimiters here\r\n"));

  // validity window, 2026-10-19T19:13:02Z to 2126-09-25T19:13:02Z
  CMS::signed_data alice{Decode::base64(test_data::alice_signature)};
  auto constexpr not_before = 1792437182L;
  auto constexpr not_after  = 4946037182L;
  auto constexpr hour       = 3600L;

  CHECK(SMIME::certificates_current(alice, at(1893456000), 2h));
  CHECK(SMIME::certificates_current(alice, at(not_before), 0h));
  CHECK(SMIME::certificates_current(alice, at(not_after), 0h));
  CHECK(!SMIME::certificates_current(alice, at(not_before - 1), 0h));
  CHECK(!SMIME::certificates_current(alice, at(not_after + 1), 0h));

  // the margin absorbs clock skew at both ends
  CHECK(SMIME::certificates_current(alice, at(not_before - 2 * hour), 2h));
  CHECK(!SMIME::certificates_current(alice, at(not_before - 2 * hour - 1), 2h));
  CHECK(SMIME::certificates_current(alice, at(not_after + 2 * hour), 2h));
  CHECK(!SMIME::certificates_current(alice, at(not_after + 2 * hour + 1), 2h));
  CHECK(SMIME::certificates_current(alice, at(not_after + 24 * hour), 24h));

  // whole seconds are compared, so the last second counts in full
  auto const late = Now{Now::time_point{std::chrono::seconds{not_after}} +
                        std::chrono::milliseconds{500}};
  CHECK(SMIME::certificates_current(alice, late, 0h));

  // notAfter in 9966
  CMS::signed_data carol{Decode::base64(test_data::carol_signature_long_lived)};
  CHECK(SMIME::certificates_current(carol, at(1893456000), 2h));
  CHECK(SMIME::certificates_current(carol, at(7258118400), 2h));
  CHECK(!SMIME::certificates_current(carol, at(1792438495 - 3 * hour), 2h));

  // no certificates, nothing to reject
  CMS::signed_data nocerts{Decode::base64(test_data::alice_signature_nocerts)};
  CHECK(SMIME::certificates_current(nocerts, at(0), 2h));

  // signer identity
  CHECK_EQ(*SMIME::signer_email(alice), "alice@example.com");
  CHECK(!SMIME::signer_email(nocerts));

  std::vector<MIME::name_addr> from;
  CHECK(!SMIME::from_matches(from, "alice@example.com"));
  CHECK(MIME::mailbox_list_parse("Alice <alice@example.com>, bob@example.org",
                                 from));
  CHECK(SMIME::from_matches(from, "alice@example.com"));
  CHECK(!SMIME::from_matches(from, "bob@example.org"));
  CHECK(!SMIME::from_matches(from, "Alice@example.com"));
  CHECK(!SMIME::from_matches(from, "alice@example.com "));
  CHECK(!SMIME::from_matches(from, ""));
}
