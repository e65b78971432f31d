#pragma once

namespace titlefs {

enum class log_level : unsigned char {
  info = 0,
  warn = 1,
  error = 2,
  off = 3,
};

// Messages below `level` are dropped. Default: info.
void set_log_level(log_level level) noexcept;

log_level get_log_level() noexcept;

// printf-style, written to stderr with a level prefix and a trailing newline.
void log_info(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

void log_warn(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

void log_error(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace titlefs
