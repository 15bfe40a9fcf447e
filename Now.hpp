#ifndef NOW_DOT_HPP
#define NOW_DOT_HPP

#include <chrono>
#include <ctime>
#include <ostream>
#include <string>

#include <glog/logging.h>

class Now {
public:
  using time_point = std::chrono::time_point<std::chrono::system_clock>;

  Now()
    : Now(std::chrono::system_clock::now())
  {
  }

  explicit Now(time_point v)
    : v_{v}
  {
    auto const t = std::chrono::system_clock::to_time_t(v_);
    tm         tm_utc;
    CHECK_NOTNULL(gmtime_r(&t, &tm_utc));

    // RFC 5322 section 3.3 date-time.
    char bfr[32];
    auto const len =
        strftime(bfr, sizeof bfr, "%a, %d %b %Y %H:%M:%S +0000", &tm_utc);
    CHECK_GT(len, 0u);
    str_.assign(bfr, len);
  }

  time_point value() const { return v_; }

  auto sec() const
  {
    return std::chrono::duration_cast<std::chrono::seconds>(
               v_.time_since_epoch())
        .count();
  }

  std::string const& string() const { return str_; }

  bool operator==(Now const& that) const { return v_ == that.v_; }
  bool operator!=(Now const& that) const { return !(*this == that); }

private:
  time_point  v_;
  std::string str_;

  friend std::ostream& operator<<(std::ostream& s, Now const& now)
  {
    return s << now.str_;
  }
};

#endif // NOW_DOT_HPP
