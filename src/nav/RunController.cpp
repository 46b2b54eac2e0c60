#include "nav/RunController.h"

#include "nav/Scenario.h"

// Cue tones
static constexpr uint16_t OBSTACLE_BEEP_HZ = 400;
static constexpr uint16_t OBSTACLE_BEEP_MS = 250;
static constexpr uint16_t SIREN_HIGH_HZ = 900;
static constexpr uint16_t SIREN_LOW_HZ = 600;
static constexpr uint16_t SIREN_BEEP_MS = 50;
static constexpr uint16_t DONE_BEEP_HZ = 1500;
static constexpr uint16_t DONE_BEEP_MS = 400;

static NavConfig sanitized(const NavConfig& cfg) {
  NavConfig out = cfg;
  out.sanitize();
  return out;
}


RunController::RunController(const NavConfig& cfg,
                             SensorPort& sensors,
                             DrivePort& drive,
                             CuePort& cue,
                             StatusSink& sink,
                             Clock& clock)
: _cfg(sanitized(cfg)),
  _sensors(sensors),
  _drive(drive),
  _cue(cue),
  _clock(clock),
  _status(sink, _cfg.debug_enabled),
  _nav(_cfg, _status),
  _effects(_cfg.effect_phase_ms)
{
}

bool RunController::start(const char* command) {
  TargetSelection sel;

  // One drive train, one run. A new command waits for DONE or a cancel.
  if (_running) {
    scenario::normalize(command, sel.command, sizeof(sel.command));
    _status.rejected(sel.command);
    _runs_rejected++;
    return false;
  }

  if (_calibrating) calibrate(false);

  if (!scenario::select(command, _cfg, sel)) {
    _status.rejected(sel.command);
    _runs_rejected++;
    return false;
  }

  if (sel.defaulted) {
    _status.debug("unknown command %s, defaulting to %s", sel.command, scenario::name(sel.scenario));
  }

  _nav.begin(sel);
  _running = true;
  _runs_started++;

  if (sel.hazard) {
    _status.debug("hazard mode active, turbo speed engaged");
    _effects.reset(_clock.nowMs());
  } else {
    _cue.setLight(true);
  }

  // Let the color sensor settle before the first (prefill) reading
  if (_cfg.settle_ms > 0) _clock.sleepMs(_cfg.settle_ms);

  return true;
}

void RunController::cancel() {
  if (_calibrating) calibrate(false);
  if (!_running) return;
  _nav.cancel();
}

bool RunController::calibrate(bool enable) {
  if (enable && _running) {
    _status.rejected("CALIBRATE");
    return false;
  }

  if (enable != _calibrating) {
    _calibrating = enable;
    _status.calibration(enable);
  }
  return true;
}

void RunController::tick() {
  if (!_running) return;

  if (_nav.selection().hazard) updateEffects_();

  const SensorSample sample = readSample_();
  const DriveActions act = _nav.step(sample);
  apply_(act);

  if (_nav.finished()) {
    _running = false;
    if (_nav.state().cancelled) _cue.setLight(false);
  }
}

/*=============================================================================
  INTERNALS
=============================================================================*/

SensorSample RunController::readSample_() {
  SensorSample s;

  s.color_valid = _sensors.readColor(s.color);
  if (!s.color_valid) s.color = Color::NONE;

  s.reflectance_valid = _sensors.readReflection(s.raw_reflectance);
  if (!s.reflectance_valid) s.raw_reflectance = 0;

  s.distance_valid = _sensors.readDistanceMm(s.distance_mm);
  if (!s.distance_valid) s.distance_mm = 0;

  return s;
}

void RunController::apply_(const DriveActions& act) {
  if (act.stop) _drive.stopAll();

  if (act.alert) _cue.beep(OBSTACLE_BEEP_HZ, OBSTACLE_BEEP_MS);

  if (act.turn_around) turnAround_();

  if (act.final_push) finalPush_();

  if (act.drive) _drive.runContinuous(act.drive_speed_dps, act.drive_speed_dps);

  if (act.confirm) {
    _cue.setLight(true);
    _cue.beep(DONE_BEEP_HZ, DONE_BEEP_MS);
  }
}

void RunController::turnAround_() {
  // Opposite wheel directions, equal angle: spin in place
  _drive.runForAngle(Side::LEFT,  _cfg.turn_speed_dps, _cfg.turn_angle_deg, true, false);
  _drive.runForAngle(Side::RIGHT, (int16_t)-_cfg.turn_speed_dps, _cfg.turn_angle_deg, true, true);

  if (_cfg.turn_settle_ms > 0) _clock.sleepMs(_cfg.turn_settle_ms);
}

void RunController::finalPush_() {
  const int16_t speed = _nav.runSpeedDps();

  _drive.runForAngle(Side::LEFT,  speed, _cfg.final_drive_angle_deg, true, false);
  _drive.runForAngle(Side::RIGHT, speed, _cfg.final_drive_angle_deg, true, true);
  _drive.stopAll();
}

void RunController::updateEffects_() {
  EffectPhase phase;
  if (!_effects.update(_clock.nowMs(), phase)) return;

  if (phase == EffectPhase::A) {
    _cue.setLight(true);
    _cue.beep(SIREN_HIGH_HZ, SIREN_BEEP_MS);
  } else {
    _cue.setLight(false);
    _cue.beep(SIREN_LOW_HZ, SIREN_BEEP_MS);
  }
}
