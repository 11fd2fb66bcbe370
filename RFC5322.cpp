#include "RFC5322.hpp"

#include "UTF8.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC5322 {
// <https://tools.ietf.org/html/rfc5322>
// clang-format off

using dot = one<'.'>;

// 3.2.3.  Atom

struct atext : sor<ALPHA, DIGIT,
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

struct atom : plus<atext> {};
struct dot_atom_text : list<atom, dot> {};

// 3.2.1.  Quoted characters, no obs-qp and no escaped WSP

struct quoted_pair : seq<one<'\\'>, VCHAR> {};

// 3.2.4.  Quoted Strings

struct qtext : sor<one<33>, ranges<35, 91, 93, 126>, RFC3629::non_ascii> {};
struct qcontent : sor<quoted_pair, WSP, qtext> {};

// 3.4.1.  Addr-Spec Specification

struct dtext : ranges<33, 90, 94, 126> {};

struct atom_only : seq<atom, eof> {};
struct dot_atom_text_only : seq<dot_atom_text, eof> {};
struct qcontent_only : seq<star<qcontent>, eof> {};
struct dtext_only : seq<star<dtext>, eof> {};

// clang-format on

namespace {
template <typename Rule>
bool recognize(std::string_view str, char const* source)
{
  memory_input<> in{str.data(), str.size(), source};
  return parse<Rule>(in);
}
} // namespace

bool is_atom(std::string_view str)
{
  return recognize<atom_only>(str, "atom");
}

bool is_dot_atom_text(std::string_view str)
{
  return recognize<dot_atom_text_only>(str, "dot-atom-text");
}

bool is_qcontent(std::string_view str)
{
  return recognize<qcontent_only>(str, "qcontent");
}

bool is_dtext(std::string_view str)
{
  return recognize<dtext_only>(str, "dtext");
}

} // namespace RFC5322
