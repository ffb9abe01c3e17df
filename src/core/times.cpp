#include "util/times.h"

#include <format>

std::string timestamp_to_string(Timestamp ts) {
  std::chrono::sys_time<milliseconds> tp{milliseconds{ts}};
  return std::format("{:%F %T}", std::chrono::floor<seconds>(tp));
}

std::string now_utc_string() {
  return std::format("{:%F %T}", std::chrono::floor<seconds>(SysClock::now()));
}
