#pragma once
#include <stdint.h>
#include <stddef.h>

#include "nav/Ports.h"
#include "nav/Zone.h"

/*
===============================================================================
  StatusReporter.h
===============================================================================

  PURPOSE
  -------
  Formats lifecycle tokens for the external bridge. The bridge matches
  these exact shapes, so every token goes through one of the helpers
  below rather than being formatted by callers.

  Token grammar (one per line):
    STATUS:START scenario=<NAME>
    STATUS:TARGET_COLOR=<ZONE>
    STATUS:TURN_AROUND
    STATUS:ABORT_OBSTACLE distance_mm=<int>
    STATUS:WRONG_WAY_FOR_<ZONE>
    STATUS:<ZONE>_REACHED
    STATUS:ZONE=<SCENARIO_NAME>
    STATUS:DONE
    STATUS:CANCELLED
    STATUS:REJECTED command=<CMD>
    STATUS:CALIBRATION=ON|OFF

  debug() lines start with "DEBUG " and are dropped unless enabled.
===============================================================================
*/

class StatusReporter {
public:
  explicit StatusReporter(StatusSink& sink, bool debug_enabled = false);

  // Writes "STATUS:<token>"
  void emit(const char* token);

  void start(const char* scenario_name);
  void targetColor(Color zone);
  void turnAround();
  void abortObstacle(int distance_mm);
  void wrongWay(Color target);
  void reached(Color zone);
  void zone(const char* scenario_name);
  void done();
  void cancelled();
  void rejected(const char* command);
  void calibration(bool on);

  // printf-style, gated by setDebugEnabled()
  void debug(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

  void setDebugEnabled(bool enable) { _debug_enabled = enable; }
  bool debugEnabled() const { return _debug_enabled; }

  // Number of STATUS lines written (debug lines not counted)
  uint16_t emitted() const { return _emitted; }

private:
  void emitf_(const char* fmt, ...);

  StatusSink& _sink;
  bool _debug_enabled;
  uint16_t _emitted = 0;

  static constexpr size_t LINE_BUF_SIZE = 96;
  char _line[LINE_BUF_SIZE];
};
