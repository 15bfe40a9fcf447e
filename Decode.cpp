#include "Decode.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>

#include <glog/logging.h>

namespace Decode {

constexpr char const CHARSET[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

namespace {
auto CHARSET_find(unsigned char ch)
{
  return static_cast<unsigned char>(
      std::find(std::begin(CHARSET), std::end(CHARSET), ch)
      - std::begin(CHARSET));
}

bool is_base64char(char ch)
{
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' ||
         ch == '/';
}

bool is_space(char ch)
{
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

int hex_value(char ch)
{
  if (ch >= '0' && ch <= '9')
    return ch - '0';
  if (ch >= 'A' && ch <= 'F')
    return ch - 'A' + 10;
  if (ch >= 'a' && ch <= 'f') // not RFC 2045, but seen in the wild
    return ch - 'a' + 10;
  return -1;
}
} // namespace

std::string base64(std::string_view text)
{
  std::string dec_text;
  dec_text.reserve((text.length() / 4) * 3);

  unsigned char group_6bit[4];
  unsigned char group_8bit[3];
  int           count_4_chars = 0;

  for (auto ch : text) {
    if (ch == '=')
      break;

    if (is_space(ch))
      continue;

    if (!is_base64char(ch))
      throw std::invalid_argument("bad character in base64");

    group_6bit[count_4_chars++] = CHARSET_find(ch);
    if (count_4_chars == 4) {
      group_8bit[0] = (group_6bit[0] << 2) + ((group_6bit[1] & 0x30) >> 4);
      group_8bit[1] =
          ((group_6bit[1] & 0xf) << 4) + ((group_6bit[2] & 0x3c) >> 2);
      group_8bit[2] = ((group_6bit[2] & 0x3) << 6) + group_6bit[3];

      dec_text.append(reinterpret_cast<char const*>(group_8bit), 3);
      count_4_chars = 0;
    }
  }

  // A lone trailing sextet can't make up an octet.
  if (count_4_chars == 1)
    throw std::invalid_argument("truncated base64");

  if (count_4_chars > 0) {
    for (int i = count_4_chars; i < 4; i++)
      group_6bit[i] = 0;

    group_8bit[0] = (group_6bit[0] << 2) + ((group_6bit[1] & 0x30) >> 4);
    group_8bit[1] =
        ((group_6bit[1] & 0xf) << 4) + ((group_6bit[2] & 0x3c) >> 2);

    dec_text.append(reinterpret_cast<char const*>(group_8bit),
                    count_4_chars - 1);
  }

  return dec_text;
}

std::string quoted_printable(std::string_view text)
{
  std::string dec_text;
  dec_text.reserve(text.length());

  // Octets written by an escape are never transport padding.
  std::string::size_type escaped = 0;

  auto const strip_trailing_ws = [&dec_text, &escaped]() {
    while (dec_text.size() > escaped &&
           (dec_text.back() == ' ' || dec_text.back() == '\t'))
      dec_text.pop_back();
  };

  for (std::string_view::size_type pos = 0; pos < text.length(); ++pos) {
    auto const ch = text[pos];

    if (ch == '\r' || ch == '\n') {
      strip_trailing_ws();
      dec_text += ch;
      continue;
    }

    if (ch != '=') {
      dec_text += ch;
      continue;
    }

    // soft line break, with the transport padding allowed before it
    auto eol = pos + 1;
    while (eol < text.length() && (text[eol] == ' ' || text[eol] == '\t'))
      ++eol;
    if (eol == text.length()) {
      pos = eol;
      continue;
    }
    if (text[eol] == '\n') {
      pos = eol;
      continue;
    }
    if (text[eol] == '\r') {
      pos = (eol + 1 < text.length() && text[eol + 1] == '\n') ? eol + 1 : eol;
      continue;
    }

    if (pos + 2 >= text.length())
      throw std::invalid_argument("truncated quoted-printable escape");

    auto const hi = hex_value(text[pos + 1]);
    auto const lo = hex_value(text[pos + 2]);
    if (hi < 0 || lo < 0)
      throw std::invalid_argument("bad quoted-printable escape");

    dec_text += static_cast<char>((hi << 4) | lo);
    escaped = dec_text.size();
    pos += 2;
  }
  strip_trailing_ws();

  return dec_text;
}

std::string transfer(std::string_view encoding, std::string_view in)
{
  if (boost::iequals(encoding, "base64"))
    return base64(in);
  if (boost::iequals(encoding, "quoted-printable"))
    return quoted_printable(in);

  if (!encoding.empty() && !boost::iequals(encoding, "7bit") &&
      !boost::iequals(encoding, "8bit") && !boost::iequals(encoding, "binary")) {
    LOG(WARNING) << "unknown Content-Transfer-Encoding \"" << encoding
                 << "\", passing body through";
  }
  return std::string(in);
}

} // namespace Decode
