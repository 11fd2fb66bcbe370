#ifndef UTF8_DOT_HPP
#define UTF8_DOT_HPP

#include <cstddef>
#include <string_view>

#include <tao/pegtl.hpp>

namespace RFC3629 {
// <https://tools.ietf.org/html/rfc3629>

using tao::pegtl::one;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::seq;
using tao::pegtl::sor;

// clang-format off

// 4.  Syntax of UTF-8 Byte Sequences

struct UTF8_tail : range<'\x80', '\xBF'> {};

struct UTF8_2 : seq<range<'\xC2', '\xDF'>, UTF8_tail> {};

struct UTF8_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, UTF8_tail>,
                    seq<range<'\xE1', '\xEC'>, rep<2, UTF8_tail>>,
                    seq<one<'\xED'>, range<'\x80', '\x9F'>, UTF8_tail>,
                    seq<range<'\xEE', '\xEF'>, rep<2, UTF8_tail>>> {};

struct UTF8_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, UTF8_tail>>,
                    seq<range<'\xF1', '\xF3'>, rep<3, UTF8_tail>>,
                    seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, UTF8_tail>>> {};

// RFC 6532 UTF8-non-ascii
struct non_ascii : sor<UTF8_2, UTF8_3, UTF8_4> {};

// clang-format on

constexpr bool is_tail(char ch) noexcept
{
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

// Number of scalar values, one per byte that is not a continuation byte.
constexpr std::size_t length(std::string_view str) noexcept
{
  std::size_t n = 0;
  for (auto ch : str) {
    if (!is_tail(ch))
      ++n;
  }
  return n;
}

} // namespace RFC3629

#endif // UTF8_DOT_HPP
