// brain dead command line tool to check email addresses

#include "EmailAddress.hpp"

#include <cstdlib>
#include <iostream>
#include <variant>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(uri, false, "print each valid address as a mailto: URI");
DEFINE_string(display_name, "", "print each valid address after this name");

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto status = EXIT_SUCCESS;

  for (auto arg{1}; arg < argc; ++arg) {
    auto const res = EmailAddress::validate(argv[arg]);

    if (auto const err = std::get_if<EmailAddress::error>(&res)) {
      std::cerr << argv[arg] << ": " << *err << '\n';
      status = EXIT_FAILURE;
      continue;
    }

    auto const& addr = std::get<EmailAddress>(res);

    if (FLAGS_uri)
      std::cout << addr.to_uri() << '\n';
    else if (!FLAGS_display_name.empty())
      std::cout << addr.to_display(FLAGS_display_name) << '\n';
    else
      std::cout << addr << '\n';
  }

  return status;
}
