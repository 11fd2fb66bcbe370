#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  CHECK(IP4::is_address_literal("[69.0.0.0]"));
  CHECK(!IP4::is_address_literal("69.0.0.0]"));
  CHECK(!IP4::is_address_literal("[69.0.0.0"));
  CHECK(!IP4::is_address_literal("[]"));
  CHECK(!IP4::is_address_literal("[1234]"));

  CHECK(IP4::is_address("0.0.0.0"));
  CHECK(IP4::is_address("9.9.9.9"));
  CHECK(IP4::is_address("99.99.99.99"));
  CHECK(IP4::is_address("192.168.2.1"));
  CHECK(IP4::is_address("255.0.0.1"));
  CHECK(IP4::is_address("255.255.255.255"));

  CHECK(!IP4::is_address("127.0.0.1."));
  CHECK(!IP4::is_address("256.0.0.1"));
  CHECK(!IP4::is_address("1.2.3"));
  CHECK(!IP4::is_address("foo.bar"));
  CHECK(!IP4::is_address(""));

  CHECK(IP6::is_address("::1"));
  CHECK(IP6::is_address("::"));
  CHECK(IP6::is_address("2001:db8::1"));
  CHECK(IP6::is_address("::ffff:0.0.0.0"));
  CHECK(IP6::is_address("::ffff:255.255.255.255"));
  CHECK(IP6::is_address("fd12:3456:789a:1::1"));
  CHECK(IP6::is_address("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));

  CHECK(!IP6::is_address("2001:db8:::1"));
  CHECK(!IP6::is_address("12345::1"));
  CHECK(!IP6::is_address("192.168.2.1"));

  CHECK(IP6::is_address_literal("[IPv6:::1]"));
  CHECK(IP6::is_address_literal("[ipv6:::1]"));
  CHECK(IP6::is_address_literal("[IPv6:2001:db8::1]"));
  CHECK(IP6::is_address_literal(
      "[IPv6:2001:0db8:85a3:0000:0000:8a2e:0370:7334]"));
  CHECK(!IP6::is_address_literal("[::1]"));
  CHECK(!IP6::is_address_literal("[IPv6:]"));
  CHECK(!IP6::is_address_literal("IPv6:::1"));

  CHECK(IP::is_address("192.168.2.1"));
  CHECK(IP::is_address("2001:db8::1"));
  CHECK(!IP::is_address("example.com"));

  CHECK(IP::is_address_literal("[192.168.2.1]"));
  CHECK(IP::is_address_literal("[IPv6:2001:db8::1]"));
  CHECK(!IP::is_address_literal("[]"));
  CHECK(!IP::is_address_literal("[tag:content]"));
  CHECK(!IP::is_address_literal("192.168.2.1"));
}
