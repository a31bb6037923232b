#include <iostream>

#include "wirehdr/cli/commands.hpp"
#include "wirehdr/utils/runtime_config.hpp"

int main(int argc, char** argv) {
  auto rc = wirehdr::utils::RuntimeConfig::load(argc, argv);
  wirehdr::utils::apply_logging(rc);
  return wirehdr::cli::run(argc, argv, rc, std::cout, std::cerr);
}
