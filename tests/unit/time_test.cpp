#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>

namespace {

using artifact::util::FormatIso8601;
using artifact::util::ParseIso8601;

// 2023-01-01T00:00:00Z
constexpr int64_t kNewYear2023Us = 1672531200LL * 1000000;

void TestFormatHasMicrosecondsAndNoZone() {
  assert(FormatIso8601(kNewYear2023Us) == "2023-01-01T00:00:00.000000");
  assert(FormatIso8601(kNewYear2023Us + 123456) == "2023-01-01T00:00:00.123456");
}

void TestParseAcceptsNaiveAndZonedForms() {
  assert(ParseIso8601("2023-01-01T00:00:00") == kNewYear2023Us);
  assert(ParseIso8601("2023-01-01 00:00:00") == kNewYear2023Us);
  assert(ParseIso8601("2023-01-01T00:00:00Z") == kNewYear2023Us);
  assert(ParseIso8601("2023-01-01T00:00:00.5") == kNewYear2023Us + 500000);
  assert(ParseIso8601("2023-01-01T02:00:00+02:00") == kNewYear2023Us);
  assert(ParseIso8601("2022-12-31T19:00:00-05:00") == kNewYear2023Us);
}

void TestParseRejectsGarbage() {
  assert(!ParseIso8601("").has_value());
  assert(!ParseIso8601("yesterday").has_value());
  assert(!ParseIso8601("2023-13-01T00:00:00").has_value());
}

void TestFormatParseAgree() {
  const int64_t now = artifact::util::ToUnixMicros(artifact::util::Now());
  assert(ParseIso8601(FormatIso8601(now)) == now);
}

} // namespace

int main() {
  TestFormatHasMicrosecondsAndNoZone();
  TestParseAcceptsNaiveAndZonedForms();
  TestParseRejectsGarbage();
  TestFormatParseAgree();

  std::cout << "artifact_manager_unit_time: pass\n";
  return 0;
}
