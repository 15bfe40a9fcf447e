// Check S/MIME signatures on message files, one verdict per line.

#include <gflags/gflags.h>
namespace gflags {
// in case we didn't have one
}

DEFINE_int32(margin_hours,
             2,
             "hours of clock skew allowed at either end of a certificate's "
             "validity period");
DEFINE_string(mail_id, "", "mail id to log with; defaults to the file name");
DEFINE_bool(ocsp_request,
            false,
            "write <file>.ocsp, a DER OCSP request for the signer certificate");

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string_view>

#include <boost/iostreams/device/mapped_file.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

#include "CMS.hpp"
#include "MIME.hpp"
#include "OCSP.hpp"
#include "SMIME-verify.hpp"

namespace fs = std::filesystem;

namespace {
void write_ocsp_request(fs::path const& path, std::string_view message)
{
  MIME::parsed msg;
  if (!msg.parse(message)) {
    LOG(INFO) << path << ": no header section, no OCSP request";
    return;
  }
  auto const sig = msg.get_node(SMIME::signature_path);
  if (!SMIME::is_signed_envelope(msg.root(), sig)) {
    LOG(INFO) << path << ": not signed, no OCSP request";
    return;
  }

  try {
    CMS::signed_data const envelope{sig->get().decoded()};
    if (envelope.certificates().empty()) {
      LOG(WARNING) << path << ": no certificates, no OCSP request";
      return;
    }
    auto const& cert   = envelope.certificates().front();
    auto const  issuer = OCSP::find_issuer(cert, envelope.certificates());
    if (!issuer) {
      LOG(WARNING) << path << ": issuer of " << cert.issuer()
                   << " not in message, no OCSP request";
      return;
    }

    auto const der = OCSP::request(cert, *issuer);

    auto out_path = path;
    out_path += ".ocsp";
    std::ofstream out(out_path, std::ios::binary);
    out.write(der.data(), der.size());
    out.close();
    if (!out) {
      LOG(ERROR) << "can't write " << out_path;
      return;
    }
    LOG(INFO) << "wrote " << out_path;
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << path << ": " << e.what();
  }
}
} // namespace

int main(int argc, char* argv[])
{
  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_margin_hours < 0) {
    LOG(ERROR) << "--margin_hours must not be negative";
    return 2;
  }

  SMIME::verifier const verifier{
      SMIME::config{std::chrono::hours{FLAGS_margin_hours}}};

  auto status = 0;

  for (auto i{1}; i < argc; ++i) {
    auto const path = fs::path(argv[i]);

    auto mail_id = path.string();
    if (!FLAGS_mail_id.empty()) {
      mail_id = (argc > 2) ? fmt::format("{}-{}", FLAGS_mail_id, i)
                           : FLAGS_mail_id;
    }

    try {
      boost::iostreams::mapped_file_source f(path.string());
      std::string_view const message(f.data(), f.size());

      auto const r = verifier.verify(message, mail_id).get();
      if (r.signer.empty()) {
        fmt::print("{}: {} {}\n", path.string(), SMIME::to_string(r.code),
                   r.message);
      }
      else {
        fmt::print("{}: {} <{}> {}\n", path.string(),
                   SMIME::to_string(r.code), r.signer, r.message);
      }
      if (!r.success)
        status = 1;

      if (FLAGS_ocsp_request)
        write_ocsp_request(path, message);
    }
    catch (std::exception const& e) {
      // No verdict for this one.
      LOG(ERROR) << path << ": " << e.what();
      status = 1;
    }
  }

  return status;
}
