#pragma once

namespace hookvault {

/// printf-style logging to stdout/stderr. The daemon redirects both streams
/// to --log-file, so every line carries a timestamp and component tag.
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

/// Per-part progress lines are only printed when verbose logging is on.
void set_verbose_logging(bool enabled);
bool verbose_logging();

}  // namespace hookvault
