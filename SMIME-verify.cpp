#include "SMIME-verify.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>

#include <glog/logging.h>

namespace {

enum class stage {
  init,
  envelope_checked,
  decoded,
  temporally_valid,
  signature_verified,
  identity_checked,
  done,
};

char const* to_string(stage s)
{
  switch (s) {
  case stage::init: return "init";
  case stage::envelope_checked: return "envelope checked";
  case stage::decoded: return "decoded";
  case stage::temporally_valid: return "temporally valid";
  case stage::signature_verified: return "signature verified";
  case stage::identity_checked: return "identity checked";
  case stage::done: return "done";
  }
  LOG(FATAL) << "unknown stage " << static_cast<int>(s);
  return "";
}

// One verification's progress and its result, filled in exactly once.
class verdict {
public:
  explicit verdict(std::string mail_id)
  {
    result_.mail_id = std::move(mail_id);
    LOG(INFO) << result_.mail_id << ": " << to_string(stage_);
  }

  std::string const& mail_id() const { return result_.mail_id; }

  void advance(stage next)
  {
    CHECK(next > stage_ && next != stage::done);
    stage_ = next;
    LOG(INFO) << result_.mail_id << ": " << to_string(stage_);
  }

  SMIME::result finish(SMIME::result_code code,
                       char const*        message,
                       std::string        signer = "")
  {
    CHECK(stage_ != stage::done) << "verdict for " << result_.mail_id
                                 << " already given";
    stage_ = stage::done;

    switch (code) {
    case SMIME::result_code::verification_ok:
      result_.success = true;
      LOG(INFO) << result_.mail_id << ": " << code << " " << signer;
      break;
    case SMIME::result_code::cannot_verify:
      result_.success = false;
      LOG(INFO) << result_.mail_id << ": " << code << " " << message;
      break;
    case SMIME::result_code::fraud_warning:
      result_.success = false;
      LOG(WARNING) << result_.mail_id << ": " << code << " " << message;
      break;
    }

    result_.code    = code;
    result_.message = message;
    result_.signer  = std::move(signer);
    return std::move(result_);
  }

private:
  stage         stage_{stage::init};
  SMIME::result result_;
};

std::future<SMIME::result> ready(SMIME::result r)
{
  std::promise<SMIME::result> p;
  p.set_value(std::move(r));
  return p.get_future();
}

} // namespace

namespace SMIME {

std::future<result> verifier::verify(std::string_view message,
                                     std::string      mail_id) const
{
  return verify(message, std::move(mail_id), Now{});
}

std::future<result> verifier::verify(std::string_view message,
                                     std::string      mail_id,
                                     Now const&       now) const
{
  try {
    verdict v{std::move(mail_id)};

    auto msg = std::make_unique<MIME::parsed>();
    if (!msg->parse(message))
      return ready(v.finish(result_code::cannot_verify, messages::not_signed));

    auto const signature = msg->get_node(signature_path);
    if (!is_signed_envelope(msg->root(), signature))
      return ready(v.finish(result_code::cannot_verify, messages::not_signed));
    v.advance(stage::envelope_checked);

    std::optional<CMS::signed_data> envelope;
    std::string                     signer;
    try {
      envelope.emplace(signature->get().decoded());
      signer = signer_email(*envelope).value_or("");
    }
    catch (std::invalid_argument const& e) {
      // CMS::decode_error, or a broken transfer encoding
      LOG(WARNING) << v.mail_id() << ": " << e.what();
      return ready(
          v.finish(result_code::fraud_warning, messages::invalid_signature));
    }
    v.advance(stage::decoded);

    if (!certificates_current(*envelope, now, config_.margin)) {
      return ready(v.finish(result_code::fraud_warning,
                            messages::certificate_expired, signer));
    }
    v.advance(stage::temporally_valid);

    // is_signed_envelope() saw children, so the body node is there.
    auto content =
        MIME::canonicalize_eol(msg->get_node(signed_body_path)->get().raw);

    return std::async(
        std::launch::async,
        [v = std::move(v), msg = std::move(msg),
         envelope = std::move(*envelope), content = std::move(content),
         signer = std::move(signer)]() mutable {
          try {
            if (!envelope.verify(0, content)) {
              return v.finish(result_code::fraud_warning,
                              messages::failed_verification, signer);
            }
          }
          catch (CMS::verify_error const& e) {
            LOG(WARNING) << v.mail_id() << ": " << e.what();
            return v.finish(result_code::cannot_verify,
                            messages::unknown_error);
          }
          v.advance(stage::signature_verified);

          if (msg->from().empty()) {
            LOG(WARNING) << v.mail_id() << ": no usable From address";
            return v.finish(result_code::cannot_verify,
                            messages::unknown_error);
          }
          if (!from_matches(msg->from(), signer)) {
            LOG(WARNING) << v.mail_id() << ": From «"
                         << msg->from().front().addr << "» signer «"
                         << signer << "»";
            return v.finish(result_code::fraud_warning,
                            messages::from_mismatch, signer);
          }
          v.advance(stage::identity_checked);

          return v.finish(result_code::verification_ok, messages::valid,
                          signer);
        });
  }
  catch (...) {
    // Not a verdict: hand it to whoever waits on the future.
    std::promise<result> p;
    p.set_exception(std::current_exception());
    return p.get_future();
  }
}

} // namespace SMIME
