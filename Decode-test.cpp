#include "Decode.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK_EQ(Decode::base64(""), "");
  CHECK_EQ(Decode::base64("Zg=="), "f");
  CHECK_EQ(Decode::base64("Zm8="), "fo");
  CHECK_EQ(Decode::base64("Zm9v"), "foo");
  CHECK_EQ(Decode::base64("Zm9vYmFy"), "foobar");

  // line broken the way S/MIME agents emit it
  CHECK_EQ(Decode::base64("Zm9v\r\nYmFy\r\n"), "foobar");
  CHECK_EQ(Decode::base64("  Zm9v YmFy\n"), "foobar");

  // binary octets survive
  auto const bin = Decode::base64("MIIBxw==");
  CHECK_EQ(bin.size(), 4u);
  CHECK_EQ(static_cast<unsigned char>(bin[0]), 0x30);
  CHECK_EQ(static_cast<unsigned char>(bin[1]), 0x82);
  CHECK_EQ(static_cast<unsigned char>(bin[2]), 0x01);
  CHECK_EQ(static_cast<unsigned char>(bin[3]), 0xc7);

  try {
    Decode::base64("Zm9v*mFy");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
  }

  try {
    Decode::base64("Zm9vY");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
  }

  CHECK_EQ(Decode::quoted_printable("caf=C3=A9"), "caf\xC3\xA9");
  CHECK_EQ(Decode::quoted_printable("soft=\r\nbreak"), "softbreak");
  CHECK_EQ(Decode::quoted_printable("soft= \nbreak"), "softbreak");
  CHECK_EQ(Decode::quoted_printable("padded   \r\nline"), "padded\r\nline");
  CHECK_EQ(Decode::quoted_printable("keep=20\r\n"), "keep \r\n");
  CHECK_EQ(Decode::quoted_printable("a=3Db"), "a=b");

  try {
    Decode::quoted_printable("bad=ZZ");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
  }

  CHECK_EQ(Decode::transfer("BASE64", "Zm9v"), "foo");
  CHECK_EQ(Decode::transfer("Quoted-Printable", "a=3Db"), "a=b");
  CHECK_EQ(Decode::transfer("7bit", "Zm9v"), "Zm9v");
  CHECK_EQ(Decode::transfer("", "as is=3D"), "as is=3D");
}
