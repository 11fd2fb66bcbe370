#include "EmailAddress.hpp"

#include <iostream>
#include <iterator>
#include <string>
#include <unordered_set>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<EmailAddress> : ostream_formatter {};

DECLARE_bool(log_rejected_addresses);

using namespace std::string_literals;

using error = EmailAddress::error;

EmailAddress valid(std::string_view address)
{
  auto const res = EmailAddress::validate(address);
  if (auto const err = std::get_if<error>(&res)) {
    LOG(FATAL) << "«" << address << "» should be valid: " << *err;
  }
  CHECK(EmailAddress::is_valid(address));
  return std::get<EmailAddress>(res);
}

error invalid(std::string_view address)
{
  auto const res = EmailAddress::validate(address);
  CHECK(std::holds_alternative<error>(res))
      << "«" << address << "» should not be valid";
  CHECK(!EmailAddress::is_valid(address));
  return std::get<error>(res);
}

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);

  // <https://en.wikipedia.org/wiki/Email_address#Examples>

  // Valid email addresses

  valid("simple@example.com");
  valid("very.common@example.com");
  valid("disposable.style.email.with+symbol@example.com");
  valid("other.email-with-hyphen@example.com");
  valid("fully-qualified-domain@example.com");

  // (may go to user.name@example.com inbox depending on mail server)
  valid("user.name+tag+sorting@example.com");

  // (one-letter local-part)
  valid("x@example.com");
  valid("example-indeed@strange-example.com");

  // (local domain name with no TLD)
  valid("admin@mailserver1");

  valid("example@s.example");

  // (space between the quotes)
  valid("\" \"@example.org");

  // (quoted double dot)
  valid("\"john..doe\"@example.org");

  // (bangified host route used for uucp mailers)
  valid("mailhost!username@example.org");

  // (% escaped mail route to user@example.com via example.org)
  valid("user%example.com@example.org");

  valid("jsmith@[192.168.2.1]");
  valid("jsmith@[IPv6:2001:db8::1]");
  valid("user+mailbox/department=shipping@example.com");
  valid("!#$%&'*+-/=?^_`.{|}~@example.com");

  // (quoted angle brackets)
  valid("\"\\<foo-bar\\>\"@example.org");

  // (an '@' is allowed in a quoted local-part)
  auto const quoted_at = valid("\"Abc@def\"@example.com");
  CHECK_EQ(quoted_at.local_part(), "\"Abc@def\"");
  CHECK_EQ(quoted_at.domain(), "example.com");

  valid("\"Joe.\\\\Blow\"@example.com");

  // Should work with UTF-8 in all the places.
  valid("用户@例子.广告");            // Chinese
  valid("अजय@डाटा.भारत");             // Hindi
  valid("квіточка@пошта.укр");      // Ukranian
  valid("θσερ@εχαμπλε.ψομ");        // Greek
  valid("Dörte@Sörensen.example.com"); // German
  valid("коля@пример.рф");          // Russian
  valid("\"♥ quoted ♥\"@♥.example.com");

  // Invalid email addresses

  // (no @ character)
  CHECK_EQ(invalid("Abc.example.com"), error::missing_separator);

  // (only one @ is allowed outside quotation marks)
  CHECK_EQ(invalid("A@b@c@example.com"), error::invalid_character);

  // (none of the special characters in this local-part are allowed
  // outside quotation marks)
  CHECK_EQ(invalid("a\"b(c)d,e:f;g<h>i[j\\k]l@example.com"),
           error::invalid_character);

  // (quoted strings must be dot separated or the only element making
  // up the local-part)
  CHECK_EQ(invalid("just\"not\"right@example.com"), error::invalid_character);

  // (spaces, quotes, and backslashes may only exist when within
  // quoted strings and preceded by a backslash)
  CHECK_EQ(invalid("this is\"not\\allowed@example.com"),
           error::invalid_character);

  // (even if escaped (preceded by a backslash), spaces, quotes, and
  // backslashes must still be contained by quotes)
  CHECK_EQ(invalid("this\\ still\"not\\allowed@example.com"),
           error::invalid_character);

  // (local part is longer than 64 characters)
  CHECK_EQ(invalid("1234567890123456789012345678901234567890123456789012345"
                   "678901234+x@example.com"),
           error::local_part_too_long);

  // Label longer than 63 characters.
  CHECK_EQ(invalid("foo@example.v1234567890123456789012345678901234567890"
                   "123456789012345678901234v.com"),
           error::sub_domain_too_long);

  CHECK_EQ(invalid("@example.com"), error::local_part_empty);
  CHECK_EQ(invalid("\"\"@example.com"), error::local_part_empty);
  CHECK_EQ(invalid("simon@"), error::domain_empty);
  CHECK_EQ(invalid("@"), error::local_part_empty);
  CHECK_EQ(invalid(""), error::missing_separator);

  // Dot placement is reported as a bad character.
  CHECK_EQ(invalid(".leading@example.com"), error::invalid_character);
  CHECK_EQ(invalid("trailing.@example.com"), error::invalid_character);
  CHECK_EQ(invalid("double..dot@example.com"), error::invalid_character);
  CHECK_EQ(invalid("user@.example.com"), error::invalid_character);
  CHECK_EQ(invalid("user@example.com."), error::invalid_character);
  CHECK_EQ(invalid("user@example..com"), error::invalid_character);

  // A lone quote is not a quoted-string, nor a lone bracket a literal.
  CHECK_EQ(invalid("\"@example.com"), error::invalid_character);
  CHECK_EQ(invalid("\"abc@example.com"), error::invalid_character);
  CHECK_EQ(invalid("\"abc\\\"@example.com"), error::invalid_character);
  CHECK_EQ(invalid("user@["), error::invalid_character);
  CHECK_EQ(invalid("user@[192.168.2.1"), error::invalid_character);
  CHECK_EQ(invalid("user@[a[b]"), error::invalid_character);
  CHECK_EQ(invalid("user@[é]"), error::invalid_character);

  // No CFWS.
  CHECK_EQ(invalid("user(comment)@example.com"), error::invalid_character);
  CHECK_EQ(invalid(" user@example.com"), error::invalid_character);
  CHECK_EQ(invalid("user@example.com "), error::invalid_character);

  // Ill-formed UTF-8.
  CHECK_EQ(invalid("us\xFFr@example.com"), error::invalid_character);
  CHECK_EQ(invalid("user@ex\xC0\x80mple.com"), error::invalid_character);

  // Local-part length boundary, counted in characters not octets.
  auto const l64 = std::string(64, 'a');
  valid(l64 + "@example.com");
  CHECK_EQ(invalid(l64 + "a@example.com"), error::local_part_too_long);

  std::string u64;
  for (auto n{0}; n < 64; ++n)
    u64 += "é";
  valid(u64 + "@example.com");
  CHECK_EQ(invalid(u64 + "é@example.com"), error::local_part_too_long);

  // The limit applies to a quoted-string, quotes and all.
  valid("\"" + std::string(62, 'q') + "\"@example.com");
  CHECK_EQ(invalid("\"" + std::string(63, 'q') + "\"@example.com"),
           error::local_part_too_long);

  // Label length boundary.
  auto const x63 = std::string(63, 'x');
  valid("user@" + x63 + ".com");
  CHECK_EQ(invalid("user@" + x63 + "x.com"), error::sub_domain_too_long);

  std::string poop63;
  for (auto n{0}; n < 63; ++n)
    poop63 += "💩";
  valid("user@" + poop63 + ".la");
  CHECK_EQ(invalid("user@" + poop63 + "💩.la"), error::sub_domain_too_long);

  // Domain length boundary.
  auto const d254 = x63 + "." + x63 + "." + x63 + "." + std::string(62, 'x');
  CHECK_EQ(d254.length(), 254u);
  valid("user@" + d254);
  CHECK_EQ(invalid("user@" + d254 + "x"), error::domain_too_long);

  // The overall domain length is checked before the label lengths.
  CHECK_EQ(invalid("user@" + std::string(255, 'x')), error::domain_too_long);
  CHECK_EQ(invalid("user@" + std::string(64, 'x')), error::sub_domain_too_long);

  // Domain-literals are only checked for dtext.
  valid("user@[]");
  valid("user@[tag:content]");
  valid("user@[999.999.999.999]");

  // Angle brackets.
  auto const angle = valid("<simple@example.com>");
  CHECK_EQ(angle.as_string(), "simple@example.com");
  CHECK_EQ(angle, valid("simple@example.com"));
  CHECK_EQ(invalid("<>"), error::missing_separator);
  CHECK_EQ(invalid("<simple@example.com"), error::invalid_character);
  CHECK_EQ(invalid("simple@example.com>"), error::invalid_character);
  CHECK_EQ(invalid("<<simple@example.com>>"), error::invalid_character);
  CHECK_EQ(invalid("Simple <simple@example.com>"), error::invalid_character);

  // Canonical form, URI and display.
  auto const simple = valid("simple@example.com");
  CHECK_EQ(simple.as_string(), "simple@example.com");
  CHECK_EQ(static_cast<std::string>(simple), "simple@example.com"s);
  CHECK_EQ(fmt::format("{}", simple), "simple@example.com");

  auto const email = valid("johnstonsk@gmail.com");
  CHECK_EQ(email.to_uri(), "mailto:johnstonsk%40gmail.com");
  CHECK_EQ(email.to_display("Simon Johnston"),
           "Simon Johnston <johnstonsk@gmail.com>");
  CHECK_EQ(email.to_display("\"Quoted, Name\""),
           "\"Quoted, Name\" <johnstonsk@gmail.com>");

  CHECK_EQ(valid("jsmith@[IPv6:2001:db8::1]").to_uri(),
           "mailto:jsmith%40%5BIPv6%3A2001%3Adb8%3A%3A1%5D");
  CHECK_EQ(valid("用户@例子.广告").to_uri(), "mailto:用户%40例子.广告");

  // Round trip, URI shape and hashing over a mixed bag.
  char const* const addresses[] = {
      "simple@example.com",
      "<angle@example.com>",
      "\"Abc@def\"@example.com",
      "\"Joe.\\\\Blow\"@example.com",
      "\" \"@example.org",
      "!#$%&'*+-/=?^_`.{|}~@example.com",
      "jsmith@[192.168.2.1]",
      "jsmith@[IPv6:2001:db8::1]",
      "user@[]",
      "用户@例子.广告",
      "Dörte@Sörensen.example.com",
  };

  std::unordered_set<EmailAddress> set;

  for (auto const address : addresses) {
    auto const addr = valid(address);

    auto const again = EmailAddress::validate(addr.as_string());
    CHECK(std::holds_alternative<EmailAddress>(again)) << addr;
    CHECK_EQ(std::get<EmailAddress>(again), addr);

    auto const uri = addr.to_uri();
    CHECK_EQ(uri.rfind("mailto:", 0), 0u) << uri;
    auto const encoded = uri.substr(7);
    CHECK_EQ(encoded.find_first_of("@[]"), std::string::npos) << uri;

    CHECK(EmailAddress::is_valid_local_part(addr.local_part())) << addr;
    CHECK(EmailAddress::is_valid_domain(addr.domain())) << addr;

    CHECK(set.insert(addr).second) << addr;
    CHECK(!set.insert(addr).second) << addr;
  }
  CHECK_EQ(set.size(), std::size(addresses));

  CHECK_EQ(std::hash<EmailAddress>{}(valid("a@b.c")),
           std::hash<EmailAddress>{}(valid("<a@b.c>")));

  // Equality is exact, case and quoting included.
  CHECK_NE(valid("a@example.com"), valid("A@example.com"));
  CHECK_NE(valid("a@example.com"), valid("a@EXAMPLE.COM"));
  CHECK_NE(valid("a@example.com"), valid("\"a\"@example.com"));

  // Partial validity.
  CHECK(EmailAddress::is_valid_local_part("simple"));
  CHECK(EmailAddress::is_valid_local_part("\"quoted@string\""));
  CHECK(!EmailAddress::is_valid_local_part(""));
  CHECK(!EmailAddress::is_valid_local_part("two words"));
  CHECK(!EmailAddress::is_valid_local_part("simple@example.com"));
  CHECK(EmailAddress::is_valid_domain("example.com"));
  CHECK(EmailAddress::is_valid_domain("[127.0.0.1]"));
  CHECK(!EmailAddress::is_valid_domain(""));
  CHECK(!EmailAddress::is_valid_domain("exa mple.com"));

  CHECK_EQ(*EmailAddress::check_local_part(""), error::local_part_empty);
  CHECK_EQ(*EmailAddress::check_local_part("\"\""), error::local_part_empty);
  CHECK_EQ(*EmailAddress::check_local_part(l64 + "a"),
           error::local_part_too_long);
  CHECK_EQ(*EmailAddress::check_domain(""), error::domain_empty);
  CHECK_EQ(*EmailAddress::check_domain("exa,mple.com"), error::invalid_character);
  CHECK_EQ(*EmailAddress::check_domain(x63 + "x.com"),
           error::sub_domain_too_long);
  CHECK(!EmailAddress::check_domain("under_score.example"));

  // The local-part is checked before the domain.
  CHECK_EQ(invalid("@"), error::local_part_empty);
  CHECK_EQ(invalid("a b@"), error::invalid_character);

  // Types of local-part and domain.
  CHECK(valid("simple@example.com").local_type() ==
        EmailAddress::local_types::dot_string);
  CHECK(valid("\"quoted\"@example.com").local_type() ==
        EmailAddress::local_types::quoted_string);
  CHECK(valid("simple@example.com").domain_type() ==
        EmailAddress::domain_types::domain);
  CHECK(valid("simple@192.168.2.1").domain_type() ==
        EmailAddress::domain_types::domain);
  CHECK(valid("jsmith@[192.168.2.1]").domain_type() ==
        EmailAddress::domain_types::address_literal);
  CHECK(valid("jsmith@[IPv6:2001:db8::1]").domain_type() ==
        EmailAddress::domain_types::address_literal);
  CHECK(valid("jsmith@[999.999.999.999]").domain_type() ==
        EmailAddress::domain_types::general_address_literal);
  CHECK(valid("user@[]").domain_type() ==
        EmailAddress::domain_types::general_address_literal);

  // The throwing constructor.
  EmailAddress const dg{"gene@digilicious.com"};
  CHECK_EQ(dg.local_part(), "gene");
  CHECK_EQ(dg.domain(), "digilicious.com");

  auto threw = false;
  try {
    EmailAddress const bad{"should throw@example.com"};
  }
  catch (bad_address const& e) {
    threw = true;
    CHECK_EQ(e.code(), error::invalid_character);
    CHECK_EQ(std::string(e.what()), "Invalid character.");
  }
  CHECK(threw);

  threw = false;
  try {
    EmailAddress const bad{"Abc.example.com"};
  }
  catch (std::invalid_argument const& e) {
    threw = true;
    CHECK_EQ(std::string(e.what()), "Missing separator character '@'.");
  }
  CHECK(threw);

  // One stable message per error.
  CHECK_EQ(EmailAddress::message(error::local_part_too_long),
           "Local part is too long. Length limit: 64");
  CHECK_EQ(EmailAddress::message(error::domain_too_long),
           "Domain is too long. Length limit: 254");
  CHECK_EQ(EmailAddress::message(error::sub_domain_too_long),
           "A sub-domain is too long. Length limit: 63");

  for (auto const err :
       {error::invalid_character, error::missing_separator,
        error::local_part_empty, error::local_part_too_long,
        error::domain_empty, error::domain_too_long,
        error::sub_domain_too_long, error::domain_too_few,
        error::domain_invalid_separator, error::unbalanced_quotes,
        error::invalid_comment, error::invalid_ip_address,
        error::cant_happen}) {
    auto const msg = EmailAddress::message(err);
    CHECK(!msg.empty());
    CHECK_EQ(msg.find('\n'), std::string::npos);
  }

  // Logging the reason changes nothing else.
  FLAGS_log_rejected_addresses = true;
  CHECK_EQ(invalid("Abc.example.com"), error::missing_separator);
  valid("simple@example.com");

  for (auto arg{1}; arg < argc; ++arg) {
    auto const res = EmailAddress::validate(argv[arg]);
    if (auto const err = std::get_if<error>(&res))
      std::cout << argv[arg] << ": " << *err << '\n';
    else
      std::cout << std::get<EmailAddress>(res) << '\n';
  }
}
