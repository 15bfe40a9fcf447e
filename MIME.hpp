#ifndef MIME_DOT_HPP_INCLUDED
#define MIME_DOT_HPP_INCLUDED

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

namespace MIME {

// RFC-5322 and MIME header names
auto constexpr From                      = "From";
auto constexpr Content_Type              = "Content-Type";
auto constexpr Content_Transfer_Encoding = "Content-Transfer-Encoding";
auto constexpr MIME_Version              = "MIME-Version";

auto constexpr max_depth = 32;

// Header field comments nest no deeper than this.
auto constexpr max_comment_depth = 32;

struct ci_less {
  bool operator()(std::string const& a, std::string const& b) const
  {
    return boost::ilexicographical_compare(a, b);
  }
};

struct header {
  std::string name;
  std::string value; // unfolded and trimmed

  bool operator==(std::string_view n) const { return boost::iequals(n, name); }
};

// <https://www.rfc-editor.org/rfc/rfc2045#section-5.1>
struct content_type {
  std::string type{"text"};        // lower case
  std::string subtype{"plain"};    // lower case
  std::map<std::string, std::string, ci_less> params{{"charset", "us-ascii"}};

  std::string value() const { return type + '/' + subtype; }

  std::optional<std::string> param(std::string const& name) const;

  static std::optional<content_type> parse(std::string_view input);
};

struct name_addr {
  std::string name;
  std::string addr;
};

class node {
public:
  std::vector<header> headers;
  MIME::content_type  content_type;

  std::string_view raw;  // the whole part: headers, blank line, body
  std::string_view body; // still transfer encoded

  std::vector<node> children;

  // The first value of the named field, or empty.
  std::string_view get_header(std::string_view name) const;

  // Body with its Content-Transfer-Encoding removed; throws
  // std::invalid_argument if the encoding is broken.
  std::string decoded() const;
};

using node_ref = std::optional<std::reference_wrapper<node const>>;

class parsed {
public:
  parsed()                         = default;
  parsed(parsed const&)            = delete;
  parsed& operator=(parsed const&) = delete;

  // Nodes refer into the copy of the message kept here.
  bool parse(std::string_view message);

  node const& root() const { return root_; }

  // Dot separated, 1-based child indexes: "1", "2", "1.2"; "" is the
  // root.  Absent if any step is missing.
  node_ref get_node(std::string_view path) const;

  // RFC5322.From of the root, in header order.
  std::vector<name_addr> const& from() const { return from_; }

private:
  std::string            message_;
  node                   root_;
  std::vector<name_addr> from_;
};

bool mailbox_list_parse(std::string_view input, std::vector<name_addr>& list);

// Bare LF to CRLF; existing CRLF pairs are left alone.
std::string canonicalize_eol(std::string_view in);

} // namespace MIME

#endif // MIME_DOT_HPP_INCLUDED
