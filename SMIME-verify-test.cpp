#include "SMIME-verify.hpp"

#include "SMIME-test-data.hpp"

#include <vector>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
Now at(long sec) { return Now{Now::time_point{std::chrono::seconds{sec}}}; }

// 2030-01-01T00:00:00Z, inside every fixture certificate's validity.
Now const in_window = at(1893456000);

void check(SMIME::result const&  r,
           SMIME::result_code    code,
           char const*           message,
           std::string_view      signer)
{
  CHECK_EQ(r.code, code) << r.message;
  CHECK_EQ(r.success, code == SMIME::result_code::verification_ok);
  CHECK_EQ(r.message, message);
  CHECK_EQ(r.signer, signer);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using SMIME::result_code;
  namespace messages = SMIME::messages;

  SMIME::verifier const verifier;
  CHECK(verifier.cfg().margin == 2h);

  auto const good = test_data::signed_message(
      "Alice Example <alice@example.com>", test_data::alice_signature);

  auto const ok = verifier.verify(good, "mail-1", in_window).get();
  CHECK_EQ(ok.mail_id, "mail-1");
  check(ok, result_code::verification_ok, messages::valid, "alice@example.com");

  // same input, same answer
  CHECK(verifier.verify(good, "mail-1", in_window).get() == ok);

  // LF line endings are restored to the CRLF that was signed
  std::string good_lf;
  for (auto ch : good) {
    if (ch != '\r')
      good_lf += ch;
  }
  check(verifier.verify(good_lf, "mail-lf", in_window).get(),
        result_code::verification_ok, messages::valid, "alice@example.com");

  // valid signature, someone else in From
  check(verifier
            .verify(test_data::signed_message("Mallory <mallory@example.net>",
                                              test_data::alice_signature),
                    "mail-2", in_window)
            .get(),
        result_code::fraud_warning, messages::from_mismatch,
        "alice@example.com");

  // identity comparison is exact
  check(verifier
            .verify(test_data::signed_message("ALICE@EXAMPLE.COM",
                                              test_data::alice_signature),
                    "mail-3", in_window)
            .get(),
        result_code::fraud_warning, messages::from_mismatch,
        "alice@example.com");

  // body altered after signing
  std::string tampered{test_data::alice_body};
  tampered.replace(tampered.find("quarterly"), 9, "annual");
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              test_data::alice_signature,
                                              tampered),
                    "mail-4", in_window)
            .get(),
        result_code::fraud_warning, messages::failed_verification,
        "alice@example.com");

  // signature part is not CMS
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              "VGhpcyBpcyBub3QgREVS\n"),
                    "mail-5", in_window)
            .get(),
        result_code::fraud_warning, messages::invalid_signature, "");

  // signature part is not even base64
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              "!!not*base64!!\n"),
                    "mail-6", in_window)
            .get(),
        result_code::fraud_warning, messages::invalid_signature, "");

  // truncated signature
  std::string_view const alice_sig{test_data::alice_signature};
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              alice_sig.substr(0, 260)),
                    "mail-7", in_window)
            .get(),
        result_code::fraud_warning, messages::invalid_signature, "");

  // expired: 2200-01-01, and not yet valid: 2000-01-01
  check(verifier.verify(good, "mail-8", at(7258118400)).get(),
        result_code::fraud_warning, messages::certificate_expired,
        "alice@example.com");
  check(verifier.verify(good, "mail-9", at(946684800)).get(),
        result_code::fraud_warning, messages::certificate_expired,
        "alice@example.com");

  // an expired certificate is reported before the body is checked
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              test_data::alice_signature,
                                              tampered),
                    "mail-18", at(7258118400))
            .get(),
        result_code::fraud_warning, messages::certificate_expired,
        "alice@example.com");

  // a certificate valid until 9966
  check(verifier
            .verify(test_data::signed_message(
                        "Carol Example <carol@example.net>",
                        test_data::carol_signature_long_lived),
                    "mail-19", in_window)
            .get(),
        result_code::verification_ok, messages::valid, "carol@example.net");

  // a margin of a century covers 2200
  SMIME::verifier const lenient{SMIME::config{std::chrono::hours{24 * 365 * 100}}};
  check(lenient.verify(good, "mail-10", at(7258118400)).get(),
        result_code::verification_ok, messages::valid, "alice@example.com");

  // plain mail
  check(verifier
            .verify("From: alice@example.com\r\n"
                    "Subject: hi\r\n"
                    "\r\n"
                    "Just text.\r\n",
                    "mail-11", in_window)
            .get(),
        result_code::cannot_verify, messages::not_signed, "");
  check(verifier.verify("", "mail-12", in_window).get(),
        result_code::cannot_verify, messages::not_signed, "");
  check(verifier.verify("no header section\r\n", "mail-13", in_window).get(),
        result_code::cannot_verify, messages::not_signed, "");

  // multipart/signed claiming an unknown micalg
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              test_data::alice_signature,
                                              test_data::alice_body, "sha3"),
                    "mail-14", in_window)
            .get(),
        result_code::cannot_verify, messages::not_signed, "");

  // signer certificate not carried in the message
  check(verifier
            .verify(test_data::signed_message("alice@example.com",
                                              test_data::alice_signature_nocerts),
                    "mail-15", in_window)
            .get(),
        result_code::cannot_verify, messages::unknown_error, "");

  // signed, but no From
  auto no_from = good;
  no_from.erase(0, no_from.find("\r\n") + 2);
  check(verifier.verify(no_from, "mail-16", in_window).get(),
        result_code::cannot_verify, messages::unknown_error, "");

  // no signed attributes
  check(verifier
            .verify(test_data::signed_message("Bob Example <bob@example.org>",
                                              test_data::bob_signature_noattr),
                    "mail-17", in_window)
            .get(),
        result_code::verification_ok, messages::valid, "bob@example.org");

  // independent concurrent calls
  std::vector<std::future<SMIME::result>> pending;
  for (auto i = 0; i < 8; ++i) {
    pending.push_back(verifier.verify(good, fmt::format("mail-c{}", i), in_window));
    pending.push_back(verifier.verify(
        test_data::signed_message("mallory@example.net",
                                  test_data::alice_signature),
        fmt::format("mail-m{}", i), in_window));
  }
  for (size_t i = 0; i < pending.size(); ++i) {
    auto const r = pending[i].get();
    if (i % 2 == 0) {
      CHECK_EQ(r.mail_id, fmt::format("mail-c{}", i / 2));
      check(r, result_code::verification_ok, messages::valid,
            "alice@example.com");
    }
    else {
      CHECK_EQ(r.mail_id, fmt::format("mail-m{}", i / 2));
      check(r, result_code::fraud_warning, messages::from_mismatch,
            "alice@example.com");
    }
  }

  // the wall clock overload; the fixture certificates are current
  // until 2126
  auto const now_result = verifier.verify(good, "mail-now").get();
  CHECK(now_result.code == result_code::verification_ok ||
        now_result.code == result_code::fraud_warning);
}
