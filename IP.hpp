#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <string_view>

// RFC 5321 section 4.1.3 address literals: "[192.0.2.1]" or
// "[IPv6:2001:db8::1]".

namespace IP4 {
auto is_address(std::string_view addr) -> bool;
auto is_address_literal(std::string_view addr) -> bool;
} // namespace IP4

namespace IP6 {
auto is_address(std::string_view addr) -> bool;
auto is_address_literal(std::string_view addr) -> bool;
} // namespace IP6

namespace IP {
bool is_address(std::string_view addr);
bool is_address_literal(std::string_view addr);
} // namespace IP

#endif // IP_DOT_HPP
