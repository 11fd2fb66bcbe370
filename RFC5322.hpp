#ifndef RFC5322_DOT_HPP
#define RFC5322_DOT_HPP

#include <string_view>

// Whole-input recognizers for the addr-spec tokens, no CFWS.

namespace RFC5322 {
bool is_atom(std::string_view str);
bool is_dot_atom_text(std::string_view str);

// The inside of a quoted-string, the empty string included.
bool is_qcontent(std::string_view str);

// The inside of a domain-literal, the empty string included.
bool is_dtext(std::string_view str);
} // namespace RFC5322

#endif // RFC5322_DOT_HPP
