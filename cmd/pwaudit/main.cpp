#include <iostream>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/runtime/command_line.hpp"

int main(int argc, char** argv) {
  const std::vector<std::string> args(argc > 0 ? argv + 1 : argv, argv + argc);

  const int exit_code = pwaudit::runtime::RunCommandLine(args, std::cout, std::cerr);

  pwaudit::observability::ShutdownLogging();
  return exit_code;
}
