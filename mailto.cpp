#include "mailto.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace mailto {

namespace {
bool is_reserved_octet(char ch)
{
  return is_reserved(static_cast<unsigned char>(ch));
}
} // namespace

std::string percent_encode(std::string_view str)
{
  auto const nesc{std::count_if(begin(str), end(str), is_reserved_octet)};
  if (!nesc)
    return std::string(str);
  std::string ret;
  ret.reserve(str.length() + 2 * nesc);
  for (auto ch : str) {
    if (is_reserved_octet(ch)) {
      ret += fmt::format("%{:02X}", static_cast<unsigned char>(ch));
    }
    else {
      ret += ch;
    }
  }
  return ret;
}

} // namespace mailto
