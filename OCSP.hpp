#ifndef OCSP_DOT_HPP
#define OCSP_DOT_HPP

#include <string>
#include <vector>

#include "CMS.hpp"

// Revocation status request construction, RFC 6960.  Diagnostic only;
// nothing here sends a request or feeds a verdict.

namespace OCSP {

// DER encoded OCSPRequest for a single certificate, CertID hashed with
// SHA-1.  With nonce, a random id-pkix-ocsp-nonce extension is added,
// so each call yields a distinct request.  Throws std::invalid_argument
// if the CertID can't be formed from the pair.
std::string request(CMS::certificate const& cert,
                    CMS::certificate const& issuer,
                    bool                    nonce = true);

// The certificate among certs that issued cert; cert itself when
// self-issued.  nullptr when none does.
CMS::certificate const* find_issuer(CMS::certificate const&              cert,
                                    std::vector<CMS::certificate> const& certs);

} // namespace OCSP

#endif // OCSP_DOT_HPP
