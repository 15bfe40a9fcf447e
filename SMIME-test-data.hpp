#ifndef SMIME_TEST_DATA_DOT_HPP
#define SMIME_TEST_DATA_DOT_HPP

#include <string>
#include <string_view>

#include <fmt/format.h>

// Signatures over alice_body, made with "openssl cms -sign -binary"
// using self-signed P-256 certificates valid from 2026-10-19 to
// 2126-09-25.

namespace test_data {

auto constexpr boundary = "----856AFAA295F92C462B8C7F08773762CA";

// The signed MIME entity, exactly as signed.
auto constexpr alice_body = "Content-Type: text/plain; charset=us-ascii\r\n"
                            "Content-Transfer-Encoding: 7bit\r\n"
                            "\r\n"
                            "Hi Bob,\r\n"
                            "\r\n"
                            "The quarterly numbers are attached below.\r\n"
                            "\r\n"
                            "-- Alice\r\n";

// CN=Alice Example, emailAddress=alice@example.com, serial 1001,
// sha256 with signed attributes
auto constexpr alice_signature =
    "MIIDhwYJKoZIhvcNAQcCoIIDeDCCA3QCAQExDTALBglghkgBZQMEAgEwCwYJKoZI\n"
    "hvcNAQcBoIIBvDCCAbgwggFfoAMCAQICAhABMAoGCCqGSM49BAMCMDoxFjAUBgNV\n"
    "BAMMDUFsaWNlIEV4YW1wbGUxIDAeBgkqhkiG9w0BCQEWEWFsaWNlQGV4YW1wbGUu\n"
    "Y29tMCAXDTI2MTAxOTE5MTMwMloYDzIxMjYwOTI1MTkxMzAyWjA6MRYwFAYDVQQD\n"
    "DA1BbGljZSBFeGFtcGxlMSAwHgYJKoZIhvcNAQkBFhFhbGljZUBleGFtcGxlLmNv\n"
    "bTBZMBMGByqGSM49AgEGCCqGSM49AwEHA0IABLOP/RD5HWfFoMWMdR5i+GXYCdIW\n"
    "gNjpsDPFWvamrQf+9VxEtsKUyx/k9diCpOFwVC9Bxh1mFBWPb/xvGmms6JGjUzBR\n"
    "MB0GA1UdDgQWBBQTWiXpcNpcLU/mKQJrSOzakCudkDAfBgNVHSMEGDAWgBQTWiXp\n"
    "cNpcLU/mKQJrSOzakCudkDAPBgNVHRMBAf8EBTADAQH/MAoGCCqGSM49BAMCA0cA\n"
    "MEQCIFZi/eL0JcZTokL61ixPlGzZbGSz/WDrMtgytrux94A1AiBAr6ODTnLFF4SD\n"
    "4yFakaKPHLXvngNKQTwvxrDn8ulA6jGCAZEwggGNAgEBMEAwOjEWMBQGA1UEAwwN\n"
    "QWxpY2UgRXhhbXBsZTEgMB4GCSqGSIb3DQEJARYRYWxpY2VAZXhhbXBsZS5jb20C\n"
    "AhABMAsGCWCGSAFlAwQCAaCB5DAYBgkqhkiG9w0BCQMxCwYJKoZIhvcNAQcBMBwG\n"
    "CSqGSIb3DQEJBTEPFw0yNjEwMTkxOTEzMDJaMC8GCSqGSIb3DQEJBDEiBCBRu5AR\n"
    "UJDDbTCU6DZYaeG/qemDn0MVG18I/Ho9PJdzVTB5BgkqhkiG9w0BCQ8xbDBqMAsG\n"
    "CWCGSAFlAwQBKjALBglghkgBZQMEARYwCwYJYIZIAWUDBAECMAoGCCqGSIb3DQMH\n"
    "MA4GCCqGSIb3DQMCAgIAgDANBggqhkiG9w0DAgIBQDAHBgUrDgMCBzANBggqhkiG\n"
    "9w0DAgIBKDAKBggqhkjOPQQDAgRGMEQCIGPLh4Bb7ax+b36Ibvn5ckxdu1JaNRdV\n"
    "NGceRDmekLxPAiA+IG4uAQmwKED+BD3Ka8g1FW49p9+pK2SJbALTTT2hbQ==\n";

// The same signer with the certificate left out of the SignedData.
auto constexpr alice_signature_nocerts =
    "MIIByAYJKoZIhvcNAQcCoIIBuTCCAbUCAQExDTALBglghkgBZQMEAgEwCwYJKoZI\n"
    "hvcNAQcBMYIBkjCCAY4CAQEwQDA6MRYwFAYDVQQDDA1BbGljZSBFeGFtcGxlMSAw\n"
    "HgYJKoZIhvcNAQkBFhFhbGljZUBleGFtcGxlLmNvbQICEAEwCwYJYIZIAWUDBAIB\n"
    "oIHkMBgGCSqGSIb3DQEJAzELBgkqhkiG9w0BBwEwHAYJKoZIhvcNAQkFMQ8XDTI2\n"
    "MTAxOTE5MTMwOFowLwYJKoZIhvcNAQkEMSIEIFG7kBFQkMNtMJToNlhp4b+p6YOf\n"
    "QxUbXwj8ej08l3NVMHkGCSqGSIb3DQEJDzFsMGowCwYJYIZIAWUDBAEqMAsGCWCG\n"
    "SAFlAwQBFjALBglghkgBZQMEAQIwCgYIKoZIhvcNAwcwDgYIKoZIhvcNAwICAgCA\n"
    "MA0GCCqGSIb3DQMCAgFAMAcGBSsOAwIHMA0GCCqGSIb3DQMCAgEoMAoGCCqGSM49\n"
    "BAMCBEcwRQIhALBaM7ukNTs+8YTMwT3QOvrn5mPrWDv5cKq3y1Hw5/L4AiBD39eX\n"
    "vt5fpIeWZh3ndY3c0j2E09H5QMLntUT+M5iNOw==\n";

// CN=Bob Example, emailAddress=bob@example.org, serial 2002,
// sha256, no signed attributes
auto constexpr bob_signature_noattr =
    "MIIClQYJKoZIhvcNAQcCoIIChjCCAoICAQExDTALBglghkgBZQMEAgEwCwYJKoZI\n"
    "hvcNAQcBoIIBtjCCAbIwggFXoAMCAQICAiACMAoGCCqGSM49BAMCMDYxFDASBgNV\n"
    "BAMMC0JvYiBFeGFtcGxlMR4wHAYJKoZIhvcNAQkBFg9ib2JAZXhhbXBsZS5vcmcw\n"
    "IBcNMjYxMDE5MTkxMzA4WhgPMjEyNjA5MjUxOTEzMDhaMDYxFDASBgNVBAMMC0Jv\n"
    "YiBFeGFtcGxlMR4wHAYJKoZIhvcNAQkBFg9ib2JAZXhhbXBsZS5vcmcwWTATBgcq\n"
    "hkjOPQIBBggqhkjOPQMBBwNCAATGEo871mzakYpr7Mflkyr87OM/WqdNueH+8qIi\n"
    "pUZiG60HN0aWTuGur8Ua/8CASEiSluCHiGq6FFxRz8MxNQpto1MwUTAdBgNVHQ4E\n"
    "FgQUo/M7Ngr9vcSQNehIMlwb7al2krIwHwYDVR0jBBgwFoAUo/M7Ngr9vcSQNehI\n"
    "Mlwb7al2krIwDwYDVR0TAQH/BAUwAwEB/zAKBggqhkjOPQQDAgNJADBGAiEA3FYx\n"
    "H7e+SRq/m4cEP8DNCYRJVjQrNzNAwtyk6VGI1mQCIQDnmU0YJrTThxV4SCthVmt+\n"
    "04DVCKprLpbBbB2uaefzjDGBpjCBowIBATA8MDYxFDASBgNVBAMMC0JvYiBFeGFt\n"
    "cGxlMR4wHAYJKoZIhvcNAQkBFg9ib2JAZXhhbXBsZS5vcmcCAiACMAsGCWCGSAFl\n"
    "AwQCATAKBggqhkjOPQQDAgRHMEUCICJH4FuU9qxZk6k1ORIuyXgE/EJ/tpkwr96c\n"
    "PeQUCjB/AiEAqgsG8Q2zsvBfSiwt3G6kRE9a+N6GjtlIOt46FrvOsMI=\n";

// CN=Carol Example, emailAddress=carol@example.net, serial 3003,
// valid from 2026-10-19T19:34:55Z to 9966-09-24T19:34:55Z
auto constexpr carol_signature_long_lived =
    "MIIDiQYJKoZIhvcNAQcCoIIDejCCA3YCAQExDTALBglghkgBZQMEAgEwCwYJKoZI\n"
    "hvcNAQcBoIIBvTCCAbkwggFfoAMCAQICAjADMAoGCCqGSM49BAMCMDoxFjAUBgNV\n"
    "BAMMDUNhcm9sIEV4YW1wbGUxIDAeBgkqhkiG9w0BCQEWEWNhcm9sQGV4YW1wbGUu\n"
    "bmV0MCAXDTI2MTAxOTE5MzQ1NVoYDzk5NjYwOTI0MTkzNDU1WjA6MRYwFAYDVQQD\n"
    "DA1DYXJvbCBFeGFtcGxlMSAwHgYJKoZIhvcNAQkBFhFjYXJvbEBleGFtcGxlLm5l\n"
    "dDBZMBMGByqGSM49AgEGCCqGSM49AwEHA0IABFtLwtwNXJNGQUN5Avynpark4a1t\n"
    "adO3K0WOjf/q0OgirlvyOA0rn9s5qttZi4c7glGYl6S4MJktN2hEq13DNYOjUzBR\n"
    "MB0GA1UdDgQWBBRwetQ/BQI5wwY7IRRsRRJ+HQ8pOTAfBgNVHSMEGDAWgBRwetQ/\n"
    "BQI5wwY7IRRsRRJ+HQ8pOTAPBgNVHRMBAf8EBTADAQH/MAoGCCqGSM49BAMCA0gA\n"
    "MEUCIB1wvxtmopIYl54CInIRS1vZSUx3T4X2oTpbzef5DZ+hAiEA5nJuv9awAoqt\n"
    "4VIf6YAf68vB4ran4HE2LiH1lTz/LFwxggGSMIIBjgIBATBAMDoxFjAUBgNVBAMM\n"
    "DUNhcm9sIEV4YW1wbGUxIDAeBgkqhkiG9w0BCQEWEWNhcm9sQGV4YW1wbGUubmV0\n"
    "AgIwAzALBglghkgBZQMEAgGggeQwGAYJKoZIhvcNAQkDMQsGCSqGSIb3DQEHATAc\n"
    "BgkqhkiG9w0BCQUxDxcNMjYxMDE5MTkzNDU1WjAvBgkqhkiG9w0BCQQxIgQgUbuQ\n"
    "EVCQw20wlOg2WGnhv6npg59DFRtfCPx6PTyXc1UweQYJKoZIhvcNAQkPMWwwajAL\n"
    "BglghkgBZQMEASowCwYJYIZIAWUDBAEWMAsGCWCGSAFlAwQBAjAKBggqhkiG9w0D\n"
    "BzAOBggqhkiG9w0DAgICAIAwDQYIKoZIhvcNAwICAUAwBwYFKw4DAgcwDQYIKoZI\n"
    "hvcNAwICASgwCgYIKoZIzj0EAwIERzBFAiEA8QLn4Gwi5uEFx57UwcZfK7jgGGcE\n"
    "yoqt4d6rCW6goNMCIC6h2Dg906Z1RtPMfXCTQv/E8hPf391zn6w1XDafTA4l\n";

// A complete multipart/signed message.
inline std::string signed_message(std::string_view from,
                                  std::string_view signature,
                                  std::string_view body = alice_body,
                                  std::string_view micalg = "sha-256")
{
  return fmt::format("From: {0}\r\n"
                     "To: Bob Example <bob@example.org>\r\n"
                     "Subject: numbers\r\n"
                     "MIME-Version: 1.0\r\n"
                     "Content-Type: multipart/signed; "
                     "protocol=\"application/pkcs7-signature\"; "
                     "micalg=\"{1}\"; boundary=\"{2}\"\r\n"
                     "\r\n"
                     "This is an S/MIME signed message\r\n"
                     "\r\n"
                     "--{2}\r\n"
                     "{3}"
                     "\r\n"
                     "--{2}\r\n"
                     "Content-Type: application/pkcs7-signature; "
                     "name=\"smime.p7s\"\r\n"
                     "Content-Transfer-Encoding: base64\r\n"
                     "Content-Disposition: attachment; "
                     "filename=\"smime.p7s\"\r\n"
                     "\r\n"
                     "{4}"
                     "\r\n"
                     "--{2}--\r\n",
                     from, micalg, boundary, body, signature);
}

} // namespace test_data

#endif // SMIME_TEST_DATA_DOT_HPP
