#ifndef HOVERTANK_LOG_H
#define HOVERTANK_LOG_H

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>

// Core-side logging. The simulation is Godot-free, so lines go through a
// sink function: TankServer installs one that forwards to
// UtilityFunctions::print / printerr, headless builds fall back to stderr.

namespace hovertank {

enum LogLevel : uint8_t { LOG_INFO = 0, LOG_WARN, LOG_ERROR };

using LogSinkFn = void (*)(LogLevel level, const std::string &line);

void set_log_sink(LogSinkFn sink);
void emit_log(LogLevel level, const std::string &line);

template <typename... Args> std::string log_concat(const Args &...args) {
  std::ostringstream os;
  (os << ... << args);
  return os.str();
}

template <typename... Args> void log_info(const Args &...args) {
  emit_log(LOG_INFO, log_concat(args...));
}
template <typename... Args> void log_warn(const Args &...args) {
  emit_log(LOG_WARN, log_concat(args...));
}
template <typename... Args> void log_error(const Args &...args) {
  emit_log(LOG_ERROR, log_concat(args...));
}

// At most one line per key per window. Keeps a persistent engine fault
// from flooding the log at 60Hz.
class ErrorThrottle {
public:
  bool allow(const std::string &key, double now_ms, double window_ms);
  void clear() { last_ms_.clear(); }

private:
  std::unordered_map<std::string, double> last_ms_;
};

} // namespace hovertank

#endif // HOVERTANK_LOG_H
