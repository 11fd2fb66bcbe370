#include "RFC5322.hpp"

#include "UTF8.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  using RFC5322::is_atom;
  using RFC5322::is_dot_atom_text;
  using RFC5322::is_dtext;
  using RFC5322::is_qcontent;

  CHECK(is_atom("simple"));
  CHECK(is_atom("!#$%&'*+-/=?^_`{|}~"));
  CHECK(is_atom("Dörte"));
  CHECK(!is_atom(""));
  CHECK(!is_atom("a.b"));
  CHECK(!is_atom("a b"));

  CHECK(is_dot_atom_text("x"));
  CHECK(is_dot_atom_text("very.common"));
  CHECK(is_dot_atom_text("disposable.style.email.with+symbol"));
  CHECK(is_dot_atom_text("例子.广告"));
  CHECK(!is_dot_atom_text(""));
  CHECK(!is_dot_atom_text("."));
  CHECK(!is_dot_atom_text(".leading"));
  CHECK(!is_dot_atom_text("trailing."));
  CHECK(!is_dot_atom_text("double..dot"));
  CHECK(!is_dot_atom_text("just\"not\"right"));
  CHECK(!is_dot_atom_text("a\"b(c)d,e:f;g<h>i[j\\k]l"));
  CHECK(!is_dot_atom_text("this\\ still\\\"not\\\\allowed"));

  CHECK(is_qcontent(""));
  CHECK(is_qcontent(" "));
  CHECK(is_qcontent("\t"));
  CHECK(is_qcontent("john..doe"));
  CHECK(is_qcontent("Abc@def"));
  CHECK(is_qcontent("Joe.\\\\Blow"));
  CHECK(is_qcontent("\\<foo-bar\\>"));
  CHECK(is_qcontent("\\\""));
  CHECK(is_qcontent("quoted string"));
  CHECK(is_qcontent("♥ ünïcödé"));
  CHECK(!is_qcontent("\""));
  CHECK(!is_qcontent("a\"b"));
  CHECK(!is_qcontent("\\"));
  CHECK(!is_qcontent("trailing\\"));
  CHECK(!is_qcontent("\\ ")); // only VCHAR may be escaped
  CHECK(!is_qcontent("\\\t"));
  CHECK(!is_qcontent("\\é"));
  CHECK(!is_qcontent("line\r\nbreak"));

  CHECK(is_dtext(""));
  CHECK(is_dtext("192.168.2.1"));
  CHECK(is_dtext("IPv6:2001:db8::1"));
  CHECK(is_dtext("tag:anything-^_`{|}~"));
  CHECK(!is_dtext("["));
  CHECK(!is_dtext("]"));
  CHECK(!is_dtext("a\\b"));
  CHECK(!is_dtext("a b"));
  CHECK(!is_dtext("例子"));

  // Ill-formed UTF-8 is never atext, qtext or dtext.
  CHECK(!is_atom("\x80"));
  CHECK(!is_atom("a\xFF"));
  CHECK(!is_atom("\xC0\x80"));             // overlong NUL
  CHECK(!is_atom("\xED\xA0\x80"));         // surrogate
  CHECK(!is_atom("\xE4\xB8"));             // truncated
  CHECK(!is_atom("\xF4\x90\x80\x80"));     // beyond U+10FFFF
  CHECK(!is_dot_atom_text("a.\xFE"));
  CHECK(!is_qcontent("\xC3"));

  CHECK_EQ(RFC3629::length(""), 0u);
  CHECK_EQ(RFC3629::length("ascii"), 5u);
  CHECK_EQ(RFC3629::length("Dörte"), 5u);
  CHECK_EQ(RFC3629::length("用户"), 2u);
  CHECK_EQ(RFC3629::length("💩.la"), 4u);
}
