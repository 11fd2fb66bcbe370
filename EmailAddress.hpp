#ifndef EMAILADDRESS_DOT_HPP
#define EMAILADDRESS_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <boost/container_hash/hash.hpp>

// An RFC 5322 addr-spec, with the RFC 6531/6532 UTF-8 extensions.  The
// local-part and domain are kept exactly as written: quotes around a
// quoted-string and brackets around a domain-literal stay in place.

class EmailAddress {
public:
  // First failure wins, exactly one per rejected address.
  enum class error : uint8_t {
    invalid_character,
    missing_separator,
    local_part_empty,
    local_part_too_long,
    domain_empty,
    domain_too_long,
    sub_domain_too_long,
    domain_too_few,           // no minimum label count is enforced
    domain_invalid_separator, // dot placement reports invalid_character
    unbalanced_quotes,        // a stray '"' reports invalid_character
    invalid_comment,          // comments are not supported
    invalid_ip_address,       // literal bodies are only checked as dtext
    cant_happen,
  };

  using result = std::variant<EmailAddress, error>;

  // RFC 5321 section 4.5.3.1, counted in scalar values.
  static constexpr std::size_t local_part_max_length = 64;
  static constexpr std::size_t domain_max_length     = 254; // RFC 3696 errata 1690
  static constexpr std::size_t sub_domain_max_length = 63;

  // Parse the input against addr-spec, optionally enclosed in "<>".
  // Throws bad_address.
  explicit EmailAddress(std::string_view address);

  static result validate(std::string_view address);
  inline static bool is_valid(std::string_view address);

  static std::optional<error> check_local_part(std::string_view part);
  static std::optional<error> check_domain(std::string_view part);

  inline static bool is_valid_local_part(std::string_view part);
  inline static bool is_valid_domain(std::string_view part);

  static std::string message(error err);

  inline std::string const& local_part() const;
  inline std::string const& domain() const;

  enum class local_types : uint8_t {
    dot_string,
    quoted_string,
  };

  enum class domain_types : uint8_t {
    domain,
    address_literal,         // IP4/IP6 address literal
    general_address_literal, // some other address literal, "[]" included
  };

  local_types  local_type() const;
  domain_types domain_type() const;

  std::string as_string() const;
  inline operator std::string() const;

  // "mailto:" URI, see mailto::percent_encode().
  std::string to_uri() const;

  // As in a header: «display_name <local@domain>», nothing escaped.
  std::string to_display(std::string_view display_name) const;

  inline bool operator==(EmailAddress const& rhs) const;
  inline bool operator!=(EmailAddress const& rhs) const;

private:
  EmailAddress(std::string_view local_part, std::string_view domain);

  std::string local_part_;
  std::string domain_;
};

class bad_address : public std::invalid_argument {
public:
  explicit bad_address(EmailAddress::error err);

  EmailAddress::error code() const noexcept { return err_; }

private:
  EmailAddress::error err_;
};

bool EmailAddress::is_valid(std::string_view address)
{
  return std::holds_alternative<EmailAddress>(validate(address));
}

bool EmailAddress::is_valid_local_part(std::string_view part)
{
  return !check_local_part(part);
}

bool EmailAddress::is_valid_domain(std::string_view part)
{
  return !check_domain(part);
}

std::string const& EmailAddress::local_part() const { return local_part_; }
std::string const& EmailAddress::domain() const { return domain_; }

EmailAddress::operator std::string() const { return as_string(); }

bool EmailAddress::operator==(EmailAddress const& rhs) const
{
  return (local_part_ == rhs.local_part_) && (domain_ == rhs.domain_);
}

bool EmailAddress::operator!=(EmailAddress const& rhs) const
{
  return !(*this == rhs);
}

inline std::ostream& operator<<(std::ostream& s, EmailAddress const& addr)
{
  return s << addr.as_string();
}

inline std::ostream& operator<<(std::ostream& s, EmailAddress::error err)
{
  return s << EmailAddress::message(err);
}

namespace std {
template <>
struct hash<EmailAddress> {
  std::size_t operator()(EmailAddress const& k) const
  {
    std::size_t seed = 0;
    boost::hash_combine(seed, k.local_part());
    boost::hash_combine(seed, k.domain());
    return seed;
  }
};
} // namespace std

#endif // EMAILADDRESS_DOT_HPP
