#ifndef CHARS_DOT_HPP
#define CHARS_DOT_HPP

#include <string_view>

// Character classes of RFC 5322 section 3, extended with UTF8-non-ascii
// as in RFC 6532 section 3.2. Each takes one Unicode scalar value.

namespace Chars {

constexpr char32_t SP         = U' ';
constexpr char32_t HTAB       = U'\t';
constexpr char32_t UTF8_start = 0x80;

// excluded from atext: "(),.:;<>@[\]
constexpr std::string_view atext_specials{"!#$%&'*+-/=?^_`{|}~"};

constexpr bool is_uchar(char32_t c) noexcept { return c >= UTF8_start; }

constexpr bool is_alpha(char32_t c) noexcept
{
  return ((U'A' <= c) && (c <= U'Z')) || ((U'a' <= c) && (c <= U'z'));
}

constexpr bool is_digit(char32_t c) noexcept
{
  return (U'0' <= c) && (c <= U'9');
}

constexpr bool is_atext(char32_t c) noexcept
{
  if (is_uchar(c))
    return true;
  if (is_alpha(c) || is_digit(c))
    return true;
  return (c != 0) &&
         (atext_specials.find(static_cast<char>(c)) != std::string_view::npos);
}

constexpr bool is_vchar(char32_t c) noexcept
{
  return (0x21 <= c) && (c <= 0x7E);
}

constexpr bool is_wsp(char32_t c) noexcept { return (c == SP) || (c == HTAB); }

// Printable ASCII less '"' and '\'.
constexpr bool is_qtext_char(char32_t c) noexcept
{
  return (c == 0x21) || ((0x23 <= c) && (c <= 0x5B)) ||
         ((0x5D <= c) && (c <= 0x7E)) || is_uchar(c);
}

// Printable ASCII less '[', ']' and '\'. No UTF-8 here.
constexpr bool is_dtext_char(char32_t c) noexcept
{
  return ((0x21 <= c) && (c <= 0x5A)) || ((0x5E <= c) && (c <= 0x7E));
}

} // namespace Chars

#endif // CHARS_DOT_HPP
