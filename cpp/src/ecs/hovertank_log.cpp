#include "hovertank_log.h"
#include <cstdio>

namespace hovertank {

static void stderr_sink(LogLevel level, const std::string &line) {
  const char *tag = level == LOG_ERROR ? "ERROR" : (level == LOG_WARN ? "WARN" : "INFO");
  std::fprintf(stderr, "[HoverTank][%s] %s\n", tag, line.c_str());
}

static LogSinkFn s_log_sink = stderr_sink;

void set_log_sink(LogSinkFn sink) { s_log_sink = sink ? sink : stderr_sink; }

void emit_log(LogLevel level, const std::string &line) { s_log_sink(level, line); }

bool ErrorThrottle::allow(const std::string &key, double now_ms,
                          double window_ms) {
  auto it = last_ms_.find(key);
  if (it != last_ms_.end() && now_ms - it->second < window_ms)
    return false;
  last_ms_[key] = now_ms;
  return true;
}

} // namespace hovertank
