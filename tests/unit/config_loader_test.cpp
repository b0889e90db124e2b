#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pwaudit_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  pattern: "[%l] %v"
snapshot:
  command: "pw-dump --no-colors"
display:
  error_color: "Red"
  normal_color: "#eeeeee"
  show_tooltip: false
target:
  device: "alsa_output.usb-Topping_D10"
)");

  auto config = pwaudit::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.snapshot().command() == "pw-dump --no-colors");
  assert(config.snapshot().dump_file().empty());
  assert(config.display().normal_color() == "#eeeeee");
  assert(config.display().has_show_tooltip());
  assert(!config.display().show_tooltip());
  assert(config.target().device() == "alsa_output.usb-Topping_D10");
}

void TestQuotedNumericScalarStaysString() {
  auto config = pwaudit::config::ConfigLoader::LoadFromYamlString(R"(target:
  device: "1234"
snapshot:
  dump_file: /tmp/pw dump.json
)");

  assert(config.target().device() == "1234");
  assert(config.snapshot().dump_file() == "/tmp/pw dump.json");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(snapshot:
  dump_file: "C:\\dumps\\\"quoted\"\\graph.json"
)");

  auto config = pwaudit::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.snapshot().dump_file() == "C:\\dumps\\\"quoted\"\\graph.json");
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = pwaudit::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.target().device().empty());
  assert(!config.display().has_show_tooltip());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(target:
  device: "usb"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)pwaudit::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const pwaudit::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)pwaudit::config::ConfigLoader::LoadFromYaml("/nonexistent/pwaudit.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestQuotedNumericScalarStaysString();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "pwaudit_unit_config_loader: pass\n";
  return 0;
}
