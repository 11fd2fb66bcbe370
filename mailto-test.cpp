#include "mailto.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  using mailto::is_reserved;
  using mailto::percent_encode;

  CHECK(is_reserved(U'@'));
  CHECK(is_reserved(U'['));
  CHECK(is_reserved(U']'));
  CHECK(!is_reserved(U'.'));
  CHECK(!is_reserved(U'-'));
  CHECK(!is_reserved(U'~'));
  CHECK(!is_reserved(U'"'));
  CHECK(!is_reserved(U'用'));

  CHECK_EQ(percent_encode("no-reserved.characters"), "no-reserved.characters");
  CHECK_EQ(percent_encode("johnstonsk@gmail.com"), "johnstonsk%40gmail.com");
  CHECK_EQ(percent_encode("!#$%&'()*+,/:;=?@[]"),
           "%21%23%24%25%26%27%28%29%2A%2B%2C%2F%3A%3B%3D%3F%40%5B%5D");
  CHECK_EQ(percent_encode("jsmith@[IPv6:2001:db8::1]"),
           "jsmith%40%5BIPv6%3A2001%3Adb8%3A%3A1%5D");
  CHECK_EQ(percent_encode("用户@例子.广告"), "用户%40例子.广告");
  CHECK_EQ(percent_encode("\"quoted string\""), "\"quoted string\"");
  CHECK_EQ(percent_encode(""), "");
}
