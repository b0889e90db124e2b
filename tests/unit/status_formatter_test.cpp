#include "internal/render/status_formatter.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

using pwaudit::audit::AuditResult;
using pwaudit::model::Outcome;
using pwaudit::render::StatusFormatter;

AuditResult ResultOf(Outcome outcome, std::optional<std::uint32_t> rate = std::nullopt) {
  AuditResult result;
  result.outcome = outcome;
  result.rate    = rate;
  return result;
}

void TestLabelsPerOutcome() {
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kError)) == "Err");
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kDeviceNotFound)) == "N/A");
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kVolumeMismatch)) == "Vol Err");
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kAmbiguousSources)) == "Src Err");
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kIdle)) == "Idle");
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kRateMismatch)) == "Freq Err");
  assert(StatusFormatter::StatusText(ResultOf(Outcome::kConsistent, 96000)) == "96000");
}

void TestColorsFollowSeverity() {
  StatusFormatter formatter;

  assert(formatter.Format(ResultOf(Outcome::kRateMismatch)) == "<txt><span color='Red'>Freq Err</span></txt><tool></tool>");
  assert(formatter.Format(ResultOf(Outcome::kIdle)) == "<txt><span color='White'>Idle</span></txt><tool></tool>");
  assert(formatter.Format(ResultOf(Outcome::kConsistent, 48000)) == "<txt><span color='White'>48000</span></txt><tool></tool>");
}

void TestTooltipIsEscapedLog() {
  auto result = ResultOf(Outcome::kDeviceNotFound);
  result.log.Add("-> Searching for device: 'R&D <dac>'");
  result.log.Add("Device not found.");

  StatusFormatter formatter;
  assert(formatter.Format(result) ==
         "<txt><span color='White'>N/A</span></txt>"
         "<tool>-&gt; Searching for device: 'R&amp;D &lt;dac&gt;'\nDevice not found.</tool>");
}

void TestDisplayConfigOverridesDefaults() {
  pwaudit::runtime::config::DisplayConfig cfg;
  cfg.set_error_color("#ff5555");
  cfg.set_normal_color("#f8f8f2");
  cfg.set_show_tooltip(false);

  StatusFormatter formatter(cfg);
  auto            result = ResultOf(Outcome::kVolumeMismatch);
  result.log.Add("Volume is not 100%");

  assert(formatter.Format(result) == "<txt><span color='#ff5555'>Vol Err</span></txt>");
  assert(formatter.Format(ResultOf(Outcome::kIdle)) == "<txt><span color='#f8f8f2'>Idle</span></txt>");
}

void TestEscapeMarkup() {
  assert(StatusFormatter::EscapeMarkup("a&b<c>d") == "a&amp;b&lt;c&gt;d");
  assert(StatusFormatter::EscapeMarkup("plain 'quoted'") == "plain 'quoted'");
}

void TestEscapeMarkupKeepsOutputValidUtf8() {
  // Well-formed multi-byte text passes through untouched.
  assert(StatusFormatter::EscapeMarkup("Lautsprecher \xC3\xBC \xE2\x82\xAC \xF0\x9F\x8E\xA7") ==
         "Lautsprecher \xC3\xBC \xE2\x82\xAC \xF0\x9F\x8E\xA7");

  // Stray, overlong, surrogate and truncated sequences are each replaced.
  assert(StatusFormatter::EscapeMarkup("\xFF\xFE dac") == "\xEF\xBF\xBD\xEF\xBF\xBD dac");
  assert(StatusFormatter::EscapeMarkup("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
  assert(StatusFormatter::EscapeMarkup("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
  assert(StatusFormatter::EscapeMarkup("x\xE2\x82") == "x\xEF\xBF\xBD\xEF\xBF\xBD");
}

void TestTooltipWithInvalidNodeNameIsValidUtf8() {
  auto result = ResultOf(Outcome::kIdle);
  result.log.Add("-> Filtering out non-running source: \xFF\xFE<sink> (state: suspended)");

  StatusFormatter formatter;
  assert(formatter.Format(result) ==
         "<txt><span color='White'>Idle</span></txt>"
         "<tool>-&gt; Filtering out non-running source: \xEF\xBF\xBD\xEF\xBF\xBD&lt;sink&gt; (state: suspended)</tool>");
}

} // namespace

int main() {
  TestLabelsPerOutcome();
  TestColorsFollowSeverity();
  TestTooltipIsEscapedLog();
  TestDisplayConfigOverridesDefaults();
  TestEscapeMarkup();
  TestEscapeMarkupKeepsOutputValidUtf8();
  TestTooltipWithInvalidNodeNameIsValidUtf8();

  std::cout << "pwaudit_unit_status_formatter: pass\n";
  return 0;
}
