#include "IP.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::rep_opt;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

namespace IP4 {

using dot = one<'.'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {
};

struct ipv4_address_only : seq<ipv4_address, eof> {
};

struct ipv4_address_literal_only
  : seq<one<'['>, ipv4_address, one<']'>, eof> {
};

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip4"};
  return parse<ipv4_address_only>(in);
}

auto is_address_literal(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip4"};
  return parse<ipv4_address_literal_only>(in);
}

} // namespace IP4

namespace IP6 {

using colon = one<':'>;

struct h16 : rep_min_max<1, 4, HEXDIG> {
};

struct ls32 : sor<seq<h16, colon, h16>, IP4::ipv4_address> {
};

struct dcolon : two<':'> {
};

// clang-format off
struct ipv6_address : sor<seq<                                          rep<6, h16, colon>, ls32>,
                          seq<                                  dcolon, rep<5, h16, colon>, ls32>,
                          seq<opt<h16                        >, dcolon, rep<4, h16, colon>, ls32>,
                          seq<opt<h16,     opt<   colon, h16>>, dcolon, rep<3, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<2, colon, h16>>, dcolon, rep<2, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<3, colon, h16>>, dcolon,        h16, colon,  ls32>,
                          seq<opt<h16, rep_opt<4, colon, h16>>, dcolon,                     ls32>,
                          seq<opt<h16, rep_opt<5, colon, h16>>, dcolon,                      h16>,
                          seq<opt<h16, rep_opt<6, colon, h16>>, dcolon                          >> {};
// clang-format on

// The "IPv6" tag is matched without regard to case.
struct ipv6_address_literal
  : seq<one<'['>, TAO_PEGTL_ISTRING("IPv6:"), ipv6_address, one<']'>> {
};

struct ipv6_address_only : seq<ipv6_address, eof> {
};

struct ipv6_address_literal_only : seq<ipv6_address_literal, eof> {
};

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<ipv6_address_only>(in);
}

auto is_address_literal(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<ipv6_address_literal_only>(in);
}

} // namespace IP6

namespace IP {
bool is_address(std::string_view addr)
{
  return IP4::is_address(addr) || IP6::is_address(addr);
}

bool is_address_literal(std::string_view addr)
{
  return IP4::is_address_literal(addr) || IP6::is_address_literal(addr);
}
} // namespace IP
