#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace pwaudit::runtime {

inline constexpr int kExitOk          = 0;
inline constexpr int kExitUsage       = 1;
inline constexpr int kExitFatalConfig = 2;

struct CommandLine {
  std::string                config_path;
  std::string                dump_file;
  std::optional<std::string> device;
};

// Arguments after the program name. std::nullopt means usage error or --help.
std::optional<CommandLine> ParseCommandLine(const std::vector<std::string>& args);

// --dump-file replaces the snapshot source; the positional device replaces target.device.
void ApplyOverrides(const CommandLine& command_line, pwaudit::runtime::config::RuntimeConfig& config);

/*
  Whole CLI invocation minus process setup.

  Prints exactly one status line to out whenever an audit runs, whatever its
  outcome, and returns kExitOk. Usage goes to err with kExitUsage; an
  unusable configuration returns kExitFatalConfig.
*/
int RunCommandLine(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace pwaudit::runtime
