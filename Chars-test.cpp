#include "Chars.hpp"

#include "RFC5322.hpp"
#include "UTF8.hpp"

#include <string>

#include <glog/logging.h>

// Just enough UTF-8 to build test input.
std::string utf8(char32_t c)
{
  std::string s;
  if (c < 0x80) {
    s += static_cast<char>(c);
  }
  else if (c < 0x800) {
    s += static_cast<char>(0xC0 | (c >> 6));
    s += static_cast<char>(0x80 | (c & 0x3F));
  }
  else if (c < 0x10000) {
    s += static_cast<char>(0xE0 | (c >> 12));
    s += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    s += static_cast<char>(0x80 | (c & 0x3F));
  }
  else {
    s += static_cast<char>(0xF0 | (c >> 18));
    s += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
    s += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    s += static_cast<char>(0x80 | (c & 0x3F));
  }
  return s;
}

int main(int argc, char* argv[])
{
  using namespace Chars;

  static_assert(is_atext(U'a'));
  static_assert(is_atext(U'~'));
  static_assert(!is_atext(U'.'));
  static_assert(!is_atext(U'@'));
  static_assert(is_uchar(0x80));
  static_assert(!is_uchar(0x7F));

  CHECK(is_atext(U'Z'));
  CHECK(is_atext(U'0'));
  for (auto c : std::u32string_view{U"!#$%&'*+-/=?^_`{|}~"})
    CHECK(is_atext(c));
  for (auto c : std::u32string_view{U"()<>[]:;@\\,.\" \t"})
    CHECK(!is_atext(c));
  CHECK(!is_atext(0));
  CHECK(is_atext(U'é'));
  CHECK(is_atext(U'用'));

  CHECK(is_vchar(U'!'));
  CHECK(is_vchar(U'~'));
  CHECK(!is_vchar(U' '));
  CHECK(!is_vchar(0x7F));
  CHECK(!is_vchar(U'é'));

  CHECK(is_wsp(U' '));
  CHECK(is_wsp(U'\t'));
  CHECK(!is_wsp(U'\n'));
  CHECK(!is_wsp(U'\r'));

  CHECK(is_qtext_char(U'!'));
  CHECK(!is_qtext_char(U'"'));
  CHECK(is_qtext_char(U'#'));
  CHECK(is_qtext_char(U'['));
  CHECK(!is_qtext_char(U'\\'));
  CHECK(is_qtext_char(U']'));
  CHECK(is_qtext_char(U'@'));
  CHECK(!is_qtext_char(U' '));
  CHECK(is_qtext_char(U'ü'));

  CHECK(is_dtext_char(U'!'));
  CHECK(is_dtext_char(U'Z'));
  CHECK(!is_dtext_char(U'['));
  CHECK(!is_dtext_char(U'\\'));
  CHECK(!is_dtext_char(U']'));
  CHECK(is_dtext_char(U'^'));
  CHECK(is_dtext_char(U':'));
  CHECK(!is_dtext_char(U' '));
  CHECK(!is_dtext_char(U'é'));

  // The predicates and the grammar must agree on every ASCII character.
  for (char32_t c = 0; c < 0x80; ++c) {
    auto const s = utf8(c);
    CHECK_EQ(is_atext(c), RFC5322::is_atom(s)) << "c == " << int(c);
    CHECK_EQ(is_wsp(c) || is_qtext_char(c), RFC5322::is_qcontent(s))
        << "c == " << int(c);
    CHECK_EQ(is_dtext_char(c), RFC5322::is_dtext(s)) << "c == " << int(c);
  }

  // And on a sample of everything else.
  for (char32_t c : {0x80, 0xA0, 0xE9, 0x7FF, 0x800, 0x4E2D, 0xFFFD, 0x10000,
                     0x1F4A9, 0x10FFFF}) {
    auto const s = utf8(c);
    CHECK_EQ(RFC3629::length(s), 1u);
    CHECK_EQ(is_atext(c), RFC5322::is_atom(s)) << "c == " << int(c);
    CHECK_EQ(is_qtext_char(c), RFC5322::is_qcontent(s)) << "c == " << int(c);
    CHECK_EQ(is_dtext_char(c), RFC5322::is_dtext(s)) << "c == " << int(c);
  }
}
