#ifndef DECODE_DOT_HPP
#define DECODE_DOT_HPP

#include <string>
#include <string_view>

// Content-Transfer-Encoding decoders, RFC 2045 section 6.

namespace Decode {
std::string base64(std::string_view in);
std::string quoted_printable(std::string_view in);

// Apply the named transfer encoding; unknown and identity encodings
// ("7bit", "8bit", "binary") return the input unchanged.
std::string transfer(std::string_view encoding, std::string_view in);
} // namespace Decode

#endif // DECODE_DOT_HPP
