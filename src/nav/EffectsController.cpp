#include "nav/EffectsController.h"

EffectsController::EffectsController(uint16_t phase_ms)
{
  setPhaseMs(phase_ms);
}

void EffectsController::reset(uint32_t now_ms) {
  _start_ms = now_ms;
  _has_last = false;
  _last = EffectPhase::A;
}

EffectPhase EffectsController::tick(uint32_t elapsed_ms) const {
  const uint32_t cycle_ms = 2UL * _phase_ms;
  return ((elapsed_ms % cycle_ms) < _phase_ms) ? EffectPhase::A : EffectPhase::B;
}

bool EffectsController::update(uint32_t now_ms, EffectPhase& out_phase) {
  // Unsigned subtraction keeps this correct across millis() rollover
  const EffectPhase phase = tick(now_ms - _start_ms);
  out_phase = phase;

  if (_has_last && phase == _last) return false;

  _has_last = true;
  _last = phase;
  return true;
}
