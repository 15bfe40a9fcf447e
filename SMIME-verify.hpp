#ifndef SMIME_VERIFY_DOT_HPP
#define SMIME_VERIFY_DOT_HPP

#include <future>
#include <string>
#include <string_view>

#include "Now.hpp"
#include "SMIME.hpp"

namespace SMIME {

class verifier {
public:
  explicit verifier(config cfg = config{})
    : config_{cfg}
  {
  }

  // Classify a raw message.  Parsing, decoding and the validity check
  // run on the calling thread; the signature check and what follows it
  // run asynchronously.  Every anticipated failure becomes a result;
  // anything else is rethrown from the future's get().
  std::future<result> verify(std::string_view message,
                             std::string      mail_id) const;

  // As above, evaluating certificate validity at now.
  std::future<result>
  verify(std::string_view message, std::string mail_id, Now const& now) const;

  config const& cfg() const { return config_; }

private:
  config const config_;
};

} // namespace SMIME

#endif // SMIME_VERIFY_DOT_HPP
