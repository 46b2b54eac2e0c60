#pragma once

#include <stdint.h>

/*
  Rate

  Fixed-period ticker for the cooperative loop(). ready(now_ms) is true
  once per period.

  The next deadline advances by exactly one period, so a 30 ms sampling
  task stays on a 30 ms grid even if one pass ran late. If the loop falls
  more than a whole period behind, the grid restarts from now instead of
  firing a burst of catch-up ticks.
*/
class Rate {
public:
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    setPeriodMs(1000UL / hz);
  }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Next ready() call fires immediately
  void reset() { _initialized = false; }

  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;
      _initialized = true;
    }

    // Signed difference keeps this correct across millis() rollover
    if ((int32_t)(now_ms - _next_ms) < 0) return false;

    _next_ms += _period_ms;
    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms = now_ms + _period_ms;
    }
    return true;
  }

  uint32_t periodMs() const { return _period_ms; }
  uint32_t nextMs() const { return _next_ms; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
