#include "command_line.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/monitor.hpp"
#include "internal/util/errors.hpp"

namespace pwaudit::runtime {

using pwaudit::observability::StringField;

namespace {

void Usage(std::ostream& err) {
  err << "Usage: pwaudit [--config <config.yaml>] [--dump-file <dump.json>] <device_name>\n"
      << "  <device_name>  substring of the node.name of the output device to audit\n";
}

} // namespace

std::optional<CommandLine> ParseCommandLine(const std::vector<std::string>& args) {
  CommandLine command_line;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--config" || arg == "--dump-file") {
      if (i + 1 >= args.size()) {
        return std::nullopt;
      }
      (arg == "--config" ? command_line.config_path : command_line.dump_file) = args[++i];
    } else if (arg == "-h" || arg == "--help") {
      return std::nullopt;
    } else if (!command_line.device) {
      command_line.device = arg;
    } else {
      return std::nullopt;
    }
  }
  return command_line;
}

void ApplyOverrides(const CommandLine& command_line, pwaudit::runtime::config::RuntimeConfig& config) {
  if (!command_line.dump_file.empty()) {
    config.mutable_snapshot()->set_dump_file(command_line.dump_file);
  }
  if (command_line.device) {
    config.mutable_target()->set_device(*command_line.device);
  }
}

int RunCommandLine(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  const auto command_line = ParseCommandLine(args);
  if (!command_line) {
    Usage(err);
    return kExitUsage;
  }

  // Default logging until the configured level is known.
  pwaudit::observability::InitializeLogging(pwaudit::runtime::config::LoggingConfig{});

  pwaudit::runtime::config::RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (!command_line->config_path.empty()) {
      config = pwaudit::config::ConfigLoader::LoadFromYaml(command_line->config_path);
    }
    ApplyOverrides(*command_line, config);

    pwaudit::observability::InitializeLogging(config.logging());
  } catch (const pwaudit::util::InvalidConfig& e) {
    PWAUDIT_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    return kExitFatalConfig;
  }

  // An empty positional device is a real target: it matches every node.
  if (!command_line->device && config.target().device().empty()) {
    PWAUDIT_LOG_WARN("No target device given on the command line or in the configuration");
    Usage(err);
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Audit and print exactly one status line
  // ------------------------------------------------------------
  auto monitor = Monitor::FromConfig(config);
  out << monitor.Run(config.target().device()) << std::endl;
  return kExitOk;
}

} // namespace pwaudit::runtime
