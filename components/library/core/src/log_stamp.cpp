/**
 * @file log_stamp.cpp
 * @brief esp_log vprintf hook adding the wall-clock prefix
 */

#include <core/log_stamp.hpp>

#include <esp_log.h>

#include <algorithm>
#include <cstdarg>
#include <cstring>

namespace core {

namespace {

const Clock *g_clock = nullptr;
vprintf_like_t g_downstream = nullptr;

int forward(const char *format, ...) {
  va_list args;
  va_start(args, format);
  int written = g_downstream(format, args);
  va_end(args);
  return written;
}

int stamped_vprintf(const char *format, va_list args) {
  if (g_clock != nullptr) {
    auto stamp = log_stamp(*g_clock);
    forward("%s : ", stamp.data());
  }
  return g_downstream(format, args);
}

} // namespace

Stamp log_stamp(const Clock &clock) {
  // One snapshot: a concurrent set() or reset() cannot split the check
  // from the read
  auto now = clock.now();
  if (now.year >= MIN_VALID_YEAR) {
    return format_stamp(now);
  }
  Stamp out{};
  std::copy_n(UNSET_STAMP, std::strlen(UNSET_STAMP), out.data());
  return out;
}

void install_log_stamp(const Clock &clock) {
  g_clock = &clock;
  if (g_downstream == nullptr) {
    g_downstream = esp_log_set_vprintf(stamped_vprintf);
  }
}

} // namespace core
