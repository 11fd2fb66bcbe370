#ifndef MAILTO_DOT_HPP
#define MAILTO_DOT_HPP

#include <string>
#include <string_view>

// RFC 6068 "mailto" URIs.

namespace mailto {

constexpr std::string_view uri_prefix{"mailto:"};

// The gen-delims and sub-delims that may appear in an addr-spec.
constexpr bool is_reserved(char32_t c) noexcept
{
  switch (c) {
  case U'!':
  case U'#':
  case U'$':
  case U'%':
  case U'&':
  case U'\'':
  case U'(':
  case U')':
  case U'*':
  case U'+':
  case U',':
  case U'/':
  case U':':
  case U';':
  case U'=':
  case U'?':
  case U'@':
  case U'[':
  case U']':
    return true;
  default:
    return false;
  }
}

// Each reserved character becomes "%XX", upper case hex. Everything
// else, UTF-8 included, is copied as-is.
std::string percent_encode(std::string_view str);

} // namespace mailto

#endif // MAILTO_DOT_HPP
