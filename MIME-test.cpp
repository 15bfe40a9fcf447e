#include "MIME.hpp"

#include <fmt/format.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  auto constexpr signed_msg = "From: \"Alice Example\" <alice@example.com>\r\n"
                              "To: bob@example.org\r\n"
                              "Subject: numbers\r\n"
                              "MIME-Version: 1.0\r\n"
                              "Content-Type: multipart/signed;\r\n"
                              "\tprotocol=\"application/pkcs7-signature\";\r\n"
                              "\tmicalg=SHA-256; boundary=\"----b1\"\r\n"
                              "\r\n"
                              "This is an S/MIME signed message\r\n"
                              "\r\n"
                              "------b1\r\n"
                              "Content-Type: text/plain; charset=us-ascii\r\n"
                              "\r\n"
                              "Hi Bob,\r\n"
                              "------b1x is not a delimiter\r\n"
                              "\r\n"
                              "------b1\r\n"
                              "Content-Type: Application/PKCS7-Signature; "
                              "name=smime.p7s\r\n"
                              "Content-Transfer-Encoding: base64\r\n"
                              "\r\n"
                              "Zm9v\r\n"
                              "YmFy\r\n"
                              "------b1--\r\n"
                              "epilogue\r\n";

  MIME::parsed msg;
  CHECK(msg.parse(signed_msg));

  auto const& root = msg.root();
  CHECK_EQ(root.content_type.value(), "multipart/signed");
  CHECK_EQ(*root.content_type.param("protocol"),
           "application/pkcs7-signature");
  CHECK_EQ(*root.content_type.param("MICALG"), "SHA-256");
  CHECK_EQ(*root.content_type.param("boundary"), "----b1");
  CHECK(!root.content_type.param("charset"));
  CHECK_EQ(root.get_header("subject"), "numbers");
  CHECK_EQ(root.children.size(), 2u);

  auto const body = msg.get_node("1");
  CHECK(body);
  CHECK_EQ(body->get().content_type.value(), "text/plain");
  CHECK_EQ(body->get().raw, "Content-Type: text/plain; charset=us-ascii\r\n"
                            "\r\n"
                            "Hi Bob,\r\n"
                            "------b1x is not a delimiter\r\n");
  CHECK_EQ(body->get().body, "Hi Bob,\r\n------b1x is not a delimiter\r\n");

  auto const sig = msg.get_node("2");
  CHECK(sig);
  CHECK_EQ(sig->get().content_type.value(), "application/pkcs7-signature");
  CHECK_EQ(sig->get().decoded(), "foobar");

  // absent nodes are not errors
  CHECK(!msg.get_node("3"));
  CHECK(!msg.get_node("0"));
  CHECK(!msg.get_node("1.1"));
  CHECK(!msg.get_node("x"));
  CHECK(!msg.get_node("1."));
  CHECK(&msg.get_node("")->get() == &root);

  CHECK_EQ(msg.from().size(), 1u);
  CHECK_EQ(msg.from()[0].addr, "alice@example.com");
  CHECK_EQ(msg.from()[0].name, "Alice Example");

  // LF only, nested multipart, no From
  auto constexpr nested_msg = "Content-Type: multipart/mixed; boundary=outer\n"
                              "\n"
                              "--outer\n"
                              "Content-Type: multipart/alternative; "
                              "boundary=inner\n"
                              "\n"
                              "--inner\n"
                              "\n"
                              "plain, no headers\n"
                              "--inner\n"
                              "Content-Type: text/html\n"
                              "\n"
                              "<p>html</p>\n"
                              "--inner--\n"
                              "--outer--\n";

  MIME::parsed nested;
  CHECK(nested.parse(nested_msg));
  CHECK(nested.from().empty());
  CHECK_EQ(nested.root().children.size(), 1u);
  auto const plain = nested.get_node("1.1");
  CHECK(plain);
  CHECK_EQ(plain->get().content_type.value(), "text/plain");
  CHECK_EQ(plain->get().body, "plain, no headers");
  auto const html = nested.get_node("1.2");
  CHECK(html);
  CHECK_EQ(html->get().body, "<p>html</p>");
  CHECK(!nested.get_node("2"));

  // a plain message has no children
  MIME::parsed plain_msg;
  CHECK(plain_msg.parse("From: bob@example.org\r\n\r\nhello\r\n"));
  CHECK_EQ(plain_msg.root().content_type.value(), "text/plain");
  CHECK(!plain_msg.get_node("1"));
  CHECK(!plain_msg.get_node("2"));

  // no header section at all
  MIME::parsed junk;
  CHECK(!junk.parse("just some text, no headers\r\n"));
  CHECK(!junk.get_node("1"));

  MIME::parsed empty;
  CHECK(!empty.parse(""));

  // Content-Type
  auto const ct = MIME::content_type::parse(
      " Multipart/Signed (comment) ; Protocol = \"application/pkcs7-signature\";"
      " micalg=\"sha-1\";");
  CHECK(ct);
  CHECK_EQ(ct->value(), "multipart/signed");
  CHECK_EQ(*ct->param("protocol"), "application/pkcs7-signature");
  CHECK_EQ(*ct->param("micalg"), "sha-1");
  CHECK(!MIME::content_type::parse("multipart"));
  CHECK(!MIME::content_type::parse("text/plain; charset"));
  CHECK(!MIME::content_type::parse(""));

  // From mailbox lists
  std::vector<MIME::name_addr> list;
  CHECK(MIME::mailbox_list_parse("alice@example.com", list));
  CHECK_EQ(list.size(), 1u);
  CHECK_EQ(list[0].addr, "alice@example.com");
  CHECK(list[0].name.empty());

  CHECK(MIME::mailbox_list_parse(
      "Alice <Alice@Example.com>, \"Bob, Jr.\" <bob@example.org>", list));
  CHECK_EQ(list.size(), 2u);
  CHECK_EQ(list[0].addr, "Alice@Example.com");
  CHECK_EQ(list[0].name, "Alice");
  CHECK_EQ(list[1].addr, "bob@example.org");
  CHECK_EQ(list[1].name, "Bob, Jr.");

  CHECK(MIME::mailbox_list_parse("=?utf-8?q?Alice?= <alice@example.com>", list));
  CHECK_EQ(list[0].addr, "alice@example.com");

  CHECK(!MIME::mailbox_list_parse("not an address", list));
  CHECK(list.empty());
  CHECK(!MIME::mailbox_list_parse("", list));

  // comment nesting is bounded
  auto const nested = [](int depth) {
    return std::string(depth, '(') + std::string(depth, ')');
  };
  CHECK(MIME::mailbox_list_parse(
      nested(MIME::max_comment_depth) + "alice@example.com", list));
  CHECK_EQ(list[0].addr, "alice@example.com");
  CHECK(!MIME::mailbox_list_parse(
      nested(MIME::max_comment_depth + 1) + "alice@example.com", list));
  CHECK(list.empty());
  CHECK(!MIME::mailbox_list_parse(std::string(100000, '(') + "alice@example.com",
                                  list));
  CHECK(MIME::mailbox_list_parse(
      fmt::format("\"{}\" <alice@example.com>", std::string(100, '(')), list));
  CHECK_EQ(list[0].name, std::string(100, '('));

  CHECK(MIME::content_type::parse("text/plain " + nested(MIME::max_comment_depth)));
  CHECK(!MIME::content_type::parse("text/plain " +
                                   nested(MIME::max_comment_depth + 1)));

  MIME::parsed deep;
  CHECK(deep.parse(fmt::format("From: {}alice@example.com\r\n"
                               "Content-Type: text/plain {}\r\n"
                               "\r\n"
                               "body\r\n",
                               std::string(100000, '('),
                               std::string(100000, '('))));
  CHECK(deep.from().empty());
  CHECK_EQ(deep.root().content_type.value(), "text/plain");

  CHECK_EQ(MIME::canonicalize_eol("a\nb\r\nc\n"), "a\r\nb\r\nc\r\n");
  CHECK_EQ(MIME::canonicalize_eol("no newline"), "no newline");
}
