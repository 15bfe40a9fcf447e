// RFC-5322 header fields, RFC-2045 Content-Type and RFC-2046 multipart
// bodies, enough to walk the structure of a signed message.

#include "MIME.hpp"

#include "Decode.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

template <typename Input>
static std::string_view make_view(Input const& in)
{
  return std::string_view(in.begin(), std::distance(in.begin(), in.end()));
}

static std::string_view trim(std::string_view v)
{
  auto constexpr WS = " \t";
  v.remove_prefix(std::min(v.find_first_not_of(WS), v.size()));
  v.remove_suffix(std::min(v.size() - v.find_last_not_of(WS) - 1, v.size()));
  return v;
}

static std::string unfold(std::string_view v)
{
  std::string ret;
  ret.reserve(v.size());
  for (auto ch : v) {
    if (ch != '\r' && ch != '\n')
      ret += ch;
  }
  return std::string(trim(ret));
}

// Deepest comment nesting in a structured field body, not counting
// parentheses quoted or inside a quoted-string.
static int comment_depth(std::string_view v)
{
  auto depth     = 0;
  auto deepest   = 0;
  auto in_quotes = false;
  for (auto it = v.begin(); it != v.end(); ++it) {
    switch (*it) {
    case '\\':
      if (std::next(it) != v.end())
        ++it;
      break;
    case '"':
      if (depth == 0)
        in_quotes = !in_quotes;
      break;
    case '(':
      if (!in_quotes)
        deepest = std::max(deepest, ++depth);
      break;
    case ')':
      if (!in_quotes && depth > 0)
        --depth;
      break;
    }
  }
  return deepest;
}

static std::string unquote(std::string_view v)
{
  if (v.size() < 2 || v.front() != '"' || v.back() != '"')
    return std::string(v);

  v.remove_prefix(1);
  v.remove_suffix(1);

  std::string ret;
  ret.reserve(v.size());
  for (auto it = v.begin(); it != v.end(); ++it) {
    if (*it == '\\' && std::next(it) != v.end())
      ++it;
    ret += *it;
  }
  return ret;
}

namespace RFC3629 {
// clang-format off

struct UTF8_tail        : range<'\x80', '\xBF'> {};

struct UTF8_2           : seq<range<'\xC2', '\xDF'>, UTF8_tail> {};

struct UTF8_3           : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, UTF8_tail>,
                              seq<range<'\xE1', '\xEC'>, rep<2, UTF8_tail>>,
                              seq<one<'\xED'>, range<'\x80', '\x9F'>, UTF8_tail>,
                              seq<range<'\xEE', '\xEF'>, rep<2, UTF8_tail>>> {};

struct UTF8_4           : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, UTF8_tail>>,
                              seq<range<'\xF1', '\xF3'>, rep<3, UTF8_tail>>,
                              seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, UTF8_tail>>> {};

struct non_ascii        : sor<UTF8_2, UTF8_3, UTF8_4> {};

// clang-format on
} // namespace RFC3629

namespace RFC5322 {

using dot   = one<'.'>;
using colon = one<':'>;

// clang-format off

//.............................................................................

// Header section.  Field bodies are taken as any octets up to an end
// of line that isn't followed by white space; 8-bit headers show up
// in signed mail too often to be strict here.

struct ftext            : ranges<33, 57, 59, 126> {};

struct field_name       : plus<ftext> {};

struct fold             : seq<eol, plus<WSP>> {};

struct field_value      : star<sor<fold, seq<not_at<eol>, any>>> {};

struct field            : seq<field_name, star<WSP>, colon, field_value, eol> {};

struct fields           : star<field> {};

struct body             : until<eof> {};

struct part             : seq<fields, sor<seq<eol, body>, eof>> {};

//.............................................................................

struct VUCHAR           : sor<VCHAR, RFC3629::non_ascii> {};

struct FWS              : seq<opt<seq<star<WSP>, eol>>, plus<WSP>> {};

// <https://tools.ietf.org/html/rfc2047>

struct tchar47          : ranges<33, 33, 35, 39, 42, 43, 45, 45, 48, 57,
                                 65, 90, 92, 92, 94, 126> {};

struct token47          : plus<tchar47> {};

struct charset          : token47 {};
struct encoding         : token47 {};

struct echar            : ranges<33, 62, 64, 126> {};

struct encoded_text     : plus<echar> {};

struct encoded_word     : seq<opt<FWS>,
                              string<'=', '?'>,
                              charset, string<'?'>,
                              encoding, string<'?'>,
                              encoded_text,
                              string<'?', '='>
                             > {};

// Comments are recursive, hence the forward declaration:
struct comment;

struct quoted_pair      : seq<one<'\\'>, sor<VUCHAR, WSP>> {};

struct ctext            : sor<ranges<33, 39, 42, 91, 93, 126>, RFC3629::non_ascii> {};

struct ccontent         : sor<ctext, quoted_pair, comment> {};

struct comment          : seq<one<'('>,
                              star<seq<opt<FWS>, ccontent>>,
                              opt<FWS>,
                              one<')'>
                             > {};

struct CFWS             : sor<seq<plus<seq<opt<FWS>, comment>>, opt<FWS>>,
                              FWS> {};

struct qtext            : sor<one<33>, ranges<35, 91, 93, 126>, RFC3629::non_ascii> {};

struct qcontent         : sor<qtext, quoted_pair> {};

struct quoted_string    : seq<opt<CFWS>,
                              DQUOTE,
                              sor<seq<star<seq<opt<FWS>, qcontent>>, opt<FWS>>, FWS>,
                              DQUOTE,
                              opt<CFWS>
                             > {};

struct atext            : sor<ALPHA, DIGIT,
                              one<'!', '#',
                                  '$', '%',
                                  '&', '\'',
                                  '*', '+',
                                  '-', '/',
                                  '=', '?',
                                  '^', '_',
                                  '`', '{',
                                  '|', '}',
                                  '~'>,
                              RFC3629::non_ascii> {};

struct atom             : seq<opt<CFWS>, plus<atext>, opt<CFWS>> {};

struct dot_atom_text    : list<plus<atext>, dot> {};

struct dot_atom         : seq<opt<CFWS>, dot_atom_text, opt<CFWS>> {};

struct word             : sor<atom, quoted_string> {};

struct phrase           : plus<sor<encoded_word, word>> {};

struct obs_local_part   : seq<word, star<seq<dot, word>>> {};

struct dtext            : ranges<33, 90, 94, 126> {};

struct domain_literal   : seq<opt<CFWS>,
                              one<'['>,
                              star<seq<opt<FWS>, dtext>>,
                              opt<FWS>,
                              one<']'>,
                              opt<CFWS>> {};

struct obs_domain       : sor<list<atom, dot>, domain_literal> {};

struct addr_spec        : seq<obs_local_part, one<'@'>, obs_domain> {};

struct obs_domain_list  : seq<star<sor<CFWS, one<','>>>, one<'@'>, obs_domain,
                              star<seq<one<','>, opt<CFWS>, opt<seq<one<'@'>, obs_domain>>>>
                             > {};

struct obs_route        : seq<obs_domain_list, colon> {};

struct angle_addr       : seq<opt<CFWS>, one<'<'>, opt<obs_route>, addr_spec, one<'>'>, opt<CFWS>> {};

struct display_name     : phrase {};

struct name_addr        : seq<opt<display_name>, angle_addr> {};

struct mailbox          : sor<name_addr, addr_spec> {};

// The obsolete syntax is a superset of the current mailbox-list, so
// it is the only one needed for parsing.
struct obs_mbox_list    : seq<star<seq<opt<CFWS>, one<','>>>,
                              mailbox,
                              star<seq<one<','>, opt<sor<mailbox, CFWS>>>>
                             > {};

struct mailbox_list_only: seq<obs_mbox_list, opt<CFWS>, eof> {};

// clang-format on

//.............................................................................

struct part_ctx {
  ::MIME::node&    node;
  std::string_view field_name;
  std::string_view field_value;
};

template <typename Rule>
struct part_action : nothing<Rule> {
};

template <>
struct part_action<field_name> {
  template <typename Input>
  static void apply(Input const& in, part_ctx& ctx)
  {
    ctx.field_name = make_view(in);
  }
};

template <>
struct part_action<field_value> {
  template <typename Input>
  static void apply(Input const& in, part_ctx& ctx)
  {
    ctx.field_value = make_view(in);
  }
};

template <>
struct part_action<field> {
  template <typename Input>
  static void apply(Input const& in, part_ctx& ctx)
  {
    ctx.node.headers.push_back(
        {std::string(ctx.field_name), unfold(ctx.field_value)});
  }
};

template <>
struct part_action<body> {
  template <typename Input>
  static void apply(Input const& in, part_ctx& ctx)
  {
    ctx.node.body = make_view(in);
  }
};

//.............................................................................

struct mailbox_list_ctx {
  std::vector<::MIME::name_addr>& list;

  std::string addr;
  std::string name;
  std::string maybe_name;
};

template <typename Rule>
struct mailbox_list_action : nothing<Rule> {
};

template <>
struct mailbox_list_action<display_name> {
  template <typename Input>
  static void apply(Input const& in, mailbox_list_ctx& ctx)
  {
    ctx.maybe_name = unquote(trim(make_view(in)));
  }
};

template <>
struct mailbox_list_action<name_addr> {
  static void apply0(mailbox_list_ctx& ctx)
  {
    std::swap(ctx.name, ctx.maybe_name);
  }
};

template <>
struct mailbox_list_action<addr_spec> {
  template <typename Input>
  static void apply(Input const& in, mailbox_list_ctx& ctx)
  {
    ctx.addr = in.string();
    boost::trim(ctx.addr);
  }
};

template <>
struct mailbox_list_action<mailbox> {
  static void apply0(mailbox_list_ctx& ctx)
  {
    ctx.list.push_back({std::move(ctx.name), std::move(ctx.addr)});
    ctx.name.clear();
    ctx.addr.clear();
    ctx.maybe_name.clear();
  }
};

} // namespace RFC5322

namespace RFC2045 {

// clang-format off

// token := 1*<any (US-ASCII) CHAR except SPACE, CTLs, or tspecials>

struct tchar            : ranges<33, 33, 35, 39, 42, 43, 45, 46, 48, 57, 65, 90, 94, 126> {};

struct token            : plus<tchar> {};

struct comment;

struct quoted_pair      : seq<one<'\\'>, not_one<'\r', '\n'>> {};

struct ctext            : not_one<'(', ')', '\\', '\r', '\n'> {};

struct comment          : seq<one<'('>, star<sor<ctext, quoted_pair, comment>>, one<')'>> {};

struct CFWS             : plus<sor<WSP, comment>> {};

struct qtext            : not_one<'"', '\\', '\r', '\n'> {};

struct quoted_string    : seq<DQUOTE, star<sor<qtext, quoted_pair>>, DQUOTE> {};

struct type             : token {};

struct subtype          : token {};

struct attribute        : token {};

struct value            : sor<token, quoted_string> {};

struct parameter        : seq<attribute, opt<CFWS>, one<'='>, opt<CFWS>, value> {};

struct content          : seq<opt<CFWS>,
                              type, opt<CFWS>, one<'/'>, opt<CFWS>, subtype, opt<CFWS>,
                              star<seq<one<';'>, opt<CFWS>, parameter, opt<CFWS>>>,
                              opt<one<';'>>, // not strictly RFC 2045, but common
                              opt<CFWS>,
                              eof> {};

// clang-format on

struct content_ctx {
  ::MIME::content_type& ct;

  std::string attribute;
  std::string value;
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<type> {
  template <typename Input>
  static void apply(Input const& in, content_ctx& ctx)
  {
    ctx.ct.type = boost::to_lower_copy(in.string());
  }
};

template <>
struct action<subtype> {
  template <typename Input>
  static void apply(Input const& in, content_ctx& ctx)
  {
    ctx.ct.subtype = boost::to_lower_copy(in.string());
  }
};

template <>
struct action<attribute> {
  template <typename Input>
  static void apply(Input const& in, content_ctx& ctx)
  {
    ctx.attribute = in.string();
  }
};

template <>
struct action<value> {
  template <typename Input>
  static void apply(Input const& in, content_ctx& ctx)
  {
    ctx.value = unquote(make_view(in));
  }
};

template <>
struct action<parameter> {
  static void apply0(content_ctx& ctx)
  {
    if (!ctx.ct.params.emplace(ctx.attribute, ctx.value).second) {
      LOG(WARNING) << "duplicate Content-Type parameter " << ctx.attribute;
    }
  }
};

} // namespace RFC2045

namespace MIME {

//.............................................................................

std::optional<std::string> content_type::param(std::string const& name) const
{
  if (auto const p = params.find(name); p != params.end())
    return p->second;
  return {};
}

std::optional<content_type> content_type::parse(std::string_view input)
{
  if (comment_depth(input) > max_comment_depth) {
    LOG(WARNING) << "Content-Type comments nested deeper than "
                 << max_comment_depth;
    return {};
  }

  content_type ct;
  ct.params.clear();

  RFC2045::content_ctx ctx{ct};

  auto in{memory_input<>(input.data(), input.size(), "content-type")};
  if (!tao::pegtl::parse<RFC2045::content, RFC2045::action>(in, ctx))
    return {};

  return ct;
}

//.............................................................................

std::string_view node::get_header(std::string_view name) const
{
  if (auto const hdr = std::find(begin(headers), end(headers), name);
      hdr != end(headers)) {
    return hdr->value;
  }
  return "";
}

std::string node::decoded() const
{
  return Decode::transfer(trim(get_header(Content_Transfer_Encoding)), body);
}

//.............................................................................

static bool is_ws(std::string_view s)
{
  return std::all_of(begin(s), end(s),
                     [](char ch) { return ch == ' ' || ch == '\t'; });
}

// <https://www.rfc-editor.org/rfc/rfc2046#section-5.1.1>
//
// The CRLF before a delimiter line belongs to the delimiter, not to
// the preceding body part.

static std::vector<std::string_view> split_multipart(std::string_view body,
                                                     std::string_view boundary)
{
  auto const delimiter = fmt::format("--{}", boundary);

  std::vector<std::string_view> parts;

  auto                        part_start = std::string_view::npos;
  std::string_view::size_type pos        = 0;

  for (;;) {
    auto const eol      = body.find('\n', pos);
    auto const line_end = (eol == std::string_view::npos) ? body.size() : eol;

    auto line = body.substr(pos, line_end - pos);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);

    if (line.starts_with(delimiter)) {
      auto       rest  = line.substr(delimiter.size());
      auto const close = rest.starts_with("--");
      if (close)
        rest.remove_prefix(2);

      if (is_ws(rest)) {
        if (part_start != std::string_view::npos) {
          auto end = pos;
          if (end > part_start && body[end - 1] == '\n')
            --end;
          if (end > part_start && body[end - 1] == '\r')
            --end;
          parts.push_back(body.substr(part_start, end - part_start));
        }
        if (close)
          return parts;
        part_start =
            (eol == std::string_view::npos) ? body.size() : eol + 1;
      }
    }

    if (eol == std::string_view::npos)
      break;
    pos = eol + 1;
  }

  if (part_start != std::string_view::npos) {
    LOG(WARNING) << "multipart body has no close-delimiter";
    parts.push_back(body.substr(part_start));
  }

  return parts;
}

static void parse_part(std::string_view raw, node& n, int depth)
{
  n.raw = raw;

  RFC5322::part_ctx ctx{n, {}, {}};

  auto in{memory_input<>(raw.data(), raw.size(), "part")};
  if (!tao::pegtl::parse<RFC5322::part, RFC5322::part_action>(in, ctx)) {
    // No header section at all, all body.
    n.headers.clear();
    n.body = raw;
  }

  if (auto const hdr = std::find(begin(n.headers), end(n.headers),
                                 Content_Type);
      hdr != end(n.headers)) {
    if (auto ct = content_type::parse(hdr->value); ct) {
      n.content_type = std::move(*ct);
    }
    else {
      LOG(WARNING) << "failed to parse «Content-Type: " << hdr->value << "»";
    }
  }

  if (n.content_type.type != "multipart")
    return;

  auto const boundary = n.content_type.param("boundary");
  if (!boundary || boundary->empty()) {
    LOG(WARNING) << n.content_type.value() << " without a boundary";
    return;
  }

  if (depth >= max_depth) {
    LOG(WARNING) << "multipart nesting deeper than " << max_depth;
    return;
  }

  for (auto const part : split_multipart(n.body, *boundary)) {
    n.children.emplace_back();
    parse_part(part, n.children.back(), depth + 1);
  }
}

bool parsed::parse(std::string_view message)
{
  message_.assign(message.data(), message.size());
  root_ = node{};
  from_.clear();

  parse_part(message_, root_, 0);

  if (root_.headers.empty()) {
    LOG(WARNING) << "message has no header section";
    return false;
  }

  if (auto hdr = std::find(begin(root_.headers), end(root_.headers), From);
      hdr != end(root_.headers)) {
    if (!mailbox_list_parse(hdr->value, from_)) {
      LOG(WARNING) << "failed to parse «From: " << hdr->value << "»";
    }

    for (auto hdr_next = std::next(hdr); hdr_next != end(root_.headers);
         hdr_next      = std::next(hdr_next)) {
      if (*hdr_next == From) {
        LOG(WARNING) << "additional RFC5322.From header «" << hdr_next->value
                     << "»";
      }
    }
  }

  return true;
}

node_ref parsed::get_node(std::string_view path) const
{
  node const* n = &root_;

  while (!path.empty()) {
    auto const dot  = path.find('.');
    auto const step = path.substr(0, dot);

    size_t idx = 0;
    auto const [ptr, ec] =
        std::from_chars(step.data(), step.data() + step.size(), idx);
    if (ec != std::errc{} || ptr != step.data() + step.size() || idx == 0 ||
        idx > n->children.size()) {
      return {};
    }
    n = &n->children[idx - 1];

    if (dot == std::string_view::npos)
      break;
    path.remove_prefix(dot + 1);
    if (path.empty()) // trailing dot
      return {};
  }

  return std::cref(*n);
}

bool mailbox_list_parse(std::string_view input, std::vector<name_addr>& list)
{
  list.clear();
  if (comment_depth(input) > max_comment_depth) {
    LOG(WARNING) << "mailbox-list comments nested deeper than "
                 << max_comment_depth;
    return false;
  }
  RFC5322::mailbox_list_ctx ctx{list, {}, {}, {}};
  auto in{memory_input<>(input.data(), input.size(), "mailbox_list_only")};
  if (tao::pegtl::parse<RFC5322::mailbox_list_only,
                        RFC5322::mailbox_list_action>(in, ctx)) {
    return true;
  }
  list.clear();
  return false;
}

std::string canonicalize_eol(std::string_view in)
{
  std::string out;
  out.reserve(in.size() + in.size() / 32);
  char prev = '\0';
  for (auto ch : in) {
    if (ch == '\n' && prev != '\r')
      out += '\r';
    out += ch;
    prev = ch;
  }
  return out;
}

} // namespace MIME
