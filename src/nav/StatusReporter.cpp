#include "nav/StatusReporter.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

StatusReporter::StatusReporter(StatusSink& sink, bool debug_enabled)
: _sink(sink),
  _debug_enabled(debug_enabled)
{
  memset(_line, 0, sizeof(_line));
}

void StatusReporter::emit(const char* token) {
  emitf_("STATUS:%s", token ? token : "");
}

void StatusReporter::start(const char* scenario_name) {
  emitf_("STATUS:START scenario=%s", scenario_name);
}

void StatusReporter::targetColor(Color zone) {
  emitf_("STATUS:TARGET_COLOR=%s", zones::colorName(zone));
}

void StatusReporter::turnAround() {
  emit("TURN_AROUND");
}

void StatusReporter::abortObstacle(int distance_mm) {
  emitf_("STATUS:ABORT_OBSTACLE distance_mm=%d", distance_mm);
}

void StatusReporter::wrongWay(Color target) {
  emitf_("STATUS:WRONG_WAY_FOR_%s", zones::colorName(target));
}

void StatusReporter::reached(Color zone) {
  emitf_("STATUS:%s_REACHED", zones::colorName(zone));
}

void StatusReporter::zone(const char* scenario_name) {
  emitf_("STATUS:ZONE=%s", scenario_name);
}

void StatusReporter::done() {
  emit("DONE");
}

void StatusReporter::cancelled() {
  emit("CANCELLED");
}

void StatusReporter::rejected(const char* command) {
  emitf_("STATUS:REJECTED command=%s", command ? command : "");
}

void StatusReporter::calibration(bool on) {
  emit(on ? "CALIBRATION=ON" : "CALIBRATION=OFF");
}

void StatusReporter::debug(const char* fmt, ...) {
  if (!_debug_enabled) return;

  // "DEBUG " prefix, then the formatted message
  const int prefix = snprintf(_line, sizeof(_line), "DEBUG ");

  va_list args;
  va_start(args, fmt);
  vsnprintf(_line + prefix, sizeof(_line) - (size_t)prefix, fmt, args);
  va_end(args);

  _sink.writeLine(_line);
}

void StatusReporter::emitf_(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_line, sizeof(_line), fmt, args);
  va_end(args);

  _sink.writeLine(_line);
  _emitted++;
}
