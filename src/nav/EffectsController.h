#pragma once
#include <stdint.h>

/*
  EffectsController

  Hazard-mode siren as a pure function of elapsed time: a square wave with
  phase A for the first phase_ms of every 2*phase_ms cycle, B for the rest.

  update() is the time-sliced form for the sampling loop. It returns true
  only on the tick where the phase changes, so the caller fires one short
  cue per edge and never blocks the loop.
*/

enum class EffectPhase : uint8_t {
  A = 0,   // high tone, light on
  B,       // low tone, light off
};

class EffectsController {
public:
  explicit EffectsController(uint16_t phase_ms = 400);

  void reset(uint32_t now_ms);

  EffectPhase tick(uint32_t elapsed_ms) const;

  bool update(uint32_t now_ms, EffectPhase& out_phase);

  void setPhaseMs(uint16_t phase_ms) { _phase_ms = (phase_ms == 0) ? 1 : phase_ms; }
  uint16_t phaseMs() const { return _phase_ms; }

private:
  uint16_t _phase_ms;
  uint32_t _start_ms = 0;
  bool _has_last = false;
  EffectPhase _last = EffectPhase::A;
};
