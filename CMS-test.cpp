#include "CMS.hpp"

#include "Decode.hpp"
#include "SMIME-test-data.hpp"

#include <glog/logging.h>

namespace {
template <typename E, typename F>
bool throws(F f)
{
  try {
    f();
  }
  catch (E const& e) {
    LOG(INFO) << "expected: " << e.what();
    return true;
  }
  return false;
}

std::chrono::sys_seconds at(long long sec)
{
  return std::chrono::sys_seconds{std::chrono::seconds{sec}};
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const alice_der = Decode::base64(test_data::alice_signature);

  CMS::signed_data alice{alice_der};
  CHECK_EQ(alice.signer_count(), 1);
  CHECK_EQ(alice.digest_algorithms().size(), 1u);
  CHECK_EQ(alice.digest_algorithms()[0], "SHA256");

  CHECK_EQ(alice.certificates().size(), 1u);
  auto const& cert = alice.certificates()[0];
  CHECK_EQ(cert.serial(), "1001");
  CHECK_EQ(cert.issuer(), "emailAddress=alice@example.com,CN=Alice Example");
  CHECK(cert.not_before() == at(1792437182)); // 2026-10-19T19:13:02Z
  CHECK(cert.not_after() == at(4946037182));  // 2126-09-25T19:13:02Z

  CHECK_EQ(cert.subject().size(), 2u);
  CHECK_EQ(cert.subject()[0].name, "CN");
  CHECK_EQ(cert.subject()[0].oid, "2.5.4.3");
  CHECK_EQ(cert.subject()[0].value, "Alice Example");
  CHECK_EQ(cert.subject()[1].name, "emailAddress");
  CHECK_EQ(*cert.subject_attribute(CMS::email_address_oid), "alice@example.com");
  CHECK(!cert.subject_attribute("2.5.4.10"));

  CHECK(alice.verify(0, test_data::alice_body));

  std::string tampered{test_data::alice_body};
  tampered.replace(tampered.find("Bob"), 3, "Eve");
  CHECK(!alice.verify(0, tampered));

  // LF line endings are not what was signed
  CHECK(!alice.verify(0, "Content-Type: text/plain; charset=us-ascii\n"));

  // each call stands alone
  CHECK(alice.verify(0, test_data::alice_body));

  CHECK(throws<CMS::verify_error>([&] { alice.verify(1, test_data::alice_body); }));

  // no signed attributes
  CMS::signed_data bob{Decode::base64(test_data::bob_signature_noattr)};
  CHECK_EQ(bob.certificates().size(), 1u);
  CHECK_EQ(bob.certificates()[0].serial(), "2002");
  CHECK_EQ(*bob.certificates()[0].subject_attribute(CMS::email_address_oid),
           "bob@example.org");
  CHECK(bob.verify(0, test_data::alice_body));
  CHECK(!bob.verify(0, tampered));

  // valid until 9966, past what a nanosecond clock can count to
  CMS::signed_data carol{Decode::base64(test_data::carol_signature_long_lived)};
  CHECK_EQ(carol.certificates().size(), 1u);
  auto const& carol_cert = carol.certificates()[0];
  CHECK_EQ(carol_cert.serial(), "3003");
  CHECK(carol_cert.not_before() == at(1792438495));   // 2026-10-19T19:34:55Z
  CHECK(carol_cert.not_after() == at(252352438495));  // 9966-09-24T19:34:55Z
  CHECK(carol_cert.not_after() > carol_cert.not_before());
  CHECK(carol.verify(0, test_data::alice_body));

  // signer certificate not in the message
  CMS::signed_data nocerts{Decode::base64(test_data::alice_signature_nocerts)};
  CHECK(nocerts.certificates().empty());
  CHECK_EQ(nocerts.signer_count(), 1);
  CHECK(throws<CMS::verify_error>(
      [&] { nocerts.verify(0, test_data::alice_body); }));

  // broken encodings
  CHECK(throws<CMS::decode_error>([] { CMS::signed_data{""}; }));
  CHECK(throws<CMS::decode_error>(
      [] { CMS::signed_data{"this is not DER at all"}; }));
  CHECK(throws<CMS::decode_error>([&] {
    CMS::signed_data{std::string_view(alice_der).substr(0, alice_der.size() / 2)};
  }));
  CHECK(throws<CMS::decode_error>([&] {
    CMS::signed_data{alice_der + std::string(2, '\0')};
  }));

  // a well formed ContentInfo of type id-data
  auto constexpr data_ci = "\x30\x11\x06\x09\x2a\x86\x48\x86\xf7\x0d\x01\x07\x01"
                           "\xa0\x04\x04\x02hi";
  CHECK(throws<CMS::decode_error>(
      [&] { CMS::signed_data{std::string_view(data_ci, 19)}; }));

  // decode_error is a std::invalid_argument
  CHECK(throws<std::invalid_argument>([] { CMS::signed_data{"\x30\x80"}; }));
}
