#include "titlefs/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace titlefs {

static std::atomic<log_level> g_level{log_level::info};

static void vlog(log_level level, const char *prefix, const char *fmt,
                 va_list args) {
  if (level < g_level.load(std::memory_order_relaxed)) {
    return;
  }
  // one fprintf per part, lines from different threads may interleave
  std::fprintf(stderr, "%s", prefix);
  std::vfprintf(stderr, fmt, args);
  std::fputc('\n', stderr);
}

void set_log_level(log_level level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

log_level get_log_level() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

void log_info(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(log_level::info, "info: ", fmt, args);
  va_end(args);
}

void log_warn(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(log_level::warn, "warning: ", fmt, args);
  va_end(args);
}

void log_error(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(log_level::error, "error: ", fmt, args);
  va_end(args);
}

}  // namespace titlefs
