#include "EmailAddress.hpp"

#include "IP.hpp"
#include "RFC5322.hpp"
#include "UTF8.hpp"
#include "mailto.hpp"

#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_rejected_addresses,
            false,
            "log the reason each invalid email address was rejected");

namespace {
constexpr char AT       = '@';
constexpr char DOT      = '.';
constexpr char DQUOTE   = '"';
constexpr char LBRACKET = '[';
constexpr char RBRACKET = ']';
constexpr char LT       = '<';
constexpr char GT       = '>';

constexpr bool is_enclosed(std::string_view str, char open, char close)
{
  return (str.length() >= 2) && (str.front() == open) && (str.back() == close);
}

constexpr std::string_view strip_enclosing(std::string_view str)
{
  return str.substr(1, str.length() - 2);
}
} // namespace

EmailAddress::EmailAddress(std::string_view local_part, std::string_view domain)
  : local_part_(local_part)
  , domain_(domain)
{
}

EmailAddress::EmailAddress(std::string_view address)
{
  auto res = validate(address);
  if (auto const err = std::get_if<error>(&res))
    throw bad_address(*err);
  *this = std::get<EmailAddress>(std::move(res));
}

bad_address::bad_address(EmailAddress::error err)
  : std::invalid_argument(EmailAddress::message(err))
  , err_(err)
{
}

std::optional<EmailAddress::error>
EmailAddress::check_local_part(std::string_view part)
{
  if (part.empty())
    return error::local_part_empty;

  if (RFC3629::length(part) > local_part_max_length)
    return error::local_part_too_long;

  // Quoting is all or nothing: a '"' anywhere but the two ends is an
  // invalid character, never an unbalanced quote.
  if (is_enclosed(part, DQUOTE, DQUOTE)) {
    if (part.length() == 2)
      return error::local_part_empty;
    if (!RFC5322::is_qcontent(strip_enclosing(part)))
      return error::invalid_character;
    return {};
  }

  if (!RFC5322::is_dot_atom_text(part))
    return error::invalid_character;

  return {};
}

std::optional<EmailAddress::error>
EmailAddress::check_domain(std::string_view part)
{
  if (part.empty())
    return error::domain_empty;

  if (RFC3629::length(part) > domain_max_length)
    return error::domain_too_long;

  // Any dtext at all is accepted, "[]" included; domain_type() tells an
  // IP address literal from the rest.
  if (is_enclosed(part, LBRACKET, RBRACKET)) {
    if (!RFC5322::is_dtext(strip_enclosing(part)))
      return error::invalid_character;
    return {};
  }

  if (!RFC5322::is_dot_atom_text(part))
    return error::invalid_character;

  auto const dom{std::string(part)};
  std::vector<std::string> labels;
  boost::algorithm::split(labels, dom, boost::algorithm::is_any_of("."));

  for (auto const& label : labels) {
    if (RFC3629::length(label) > sub_domain_max_length)
      return error::sub_domain_too_long;
  }

  return {};
}

EmailAddress::result EmailAddress::validate(std::string_view address)
{
  auto const reject = [address](error err) -> result {
    if (FLAGS_log_rejected_addresses)
      LOG(INFO) << "rejected «" << address << "»: " << message(err);
    return err;
  };

  auto addr_spec = address;
  if (is_enclosed(addr_spec, LT, GT))
    addr_spec = strip_enclosing(addr_spec);

  // A quoted local-part may hold an '@', a domain never does.
  auto const sep = addr_spec.rfind(AT);
  if (sep == std::string_view::npos)
    return reject(error::missing_separator);

  auto const local  = addr_spec.substr(0, sep);
  auto const domain = addr_spec.substr(sep + 1);

  if (auto const err = check_local_part(local))
    return reject(*err);

  if (auto const err = check_domain(domain))
    return reject(*err);

  return EmailAddress{local, domain};
}

std::string EmailAddress::message(error err)
{
  switch (err) {
  case error::invalid_character:
    return "Invalid character.";
  case error::missing_separator:
    return fmt::format("Missing separator character '{}'.", AT);
  case error::local_part_empty:
    return "Local part is empty.";
  case error::local_part_too_long:
    return fmt::format("Local part is too long. Length limit: {}",
                       local_part_max_length);
  case error::domain_empty:
    return "Domain is empty.";
  case error::domain_too_long:
    return fmt::format("Domain is too long. Length limit: {}",
                       domain_max_length);
  case error::sub_domain_too_long:
    return fmt::format("A sub-domain is too long. Length limit: {}",
                       sub_domain_max_length);
  case error::domain_too_few:
    return "Too few parts in the domain.";
  case error::domain_invalid_separator:
    return fmt::format("Invalid placement of the domain separator '{}'.", DOT);
  case error::unbalanced_quotes:
    return "Quotes around the local-part are unbalanced.";
  case error::invalid_comment:
    return "A comment was badly formed.";
  case error::invalid_ip_address:
    return "Invalid IP Address specified for domain.";
  case error::cant_happen:
    return "An impossible error was encountered.";
  }
  return fmt::format("Unknown error {}.", static_cast<int>(err));
}

EmailAddress::local_types EmailAddress::local_type() const
{
  return is_enclosed(local_part_, DQUOTE, DQUOTE) ? local_types::quoted_string
                                                  : local_types::dot_string;
}

EmailAddress::domain_types EmailAddress::domain_type() const
{
  if (!is_enclosed(domain_, LBRACKET, RBRACKET))
    return domain_types::domain;
  if (IP::is_address_literal(domain_))
    return domain_types::address_literal;
  return domain_types::general_address_literal;
}

std::string EmailAddress::as_string() const
{
  return fmt::format("{}{}{}", local_part_, AT, domain_);
}

std::string EmailAddress::to_uri() const
{
  return fmt::format("{}{}", mailto::uri_prefix,
                     mailto::percent_encode(as_string()));
}

std::string EmailAddress::to_display(std::string_view display_name) const
{
  return fmt::format("{} <{}>", display_name, as_string());
}
