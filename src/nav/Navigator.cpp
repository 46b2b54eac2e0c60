#include "nav/Navigator.h"

/*
===============================================================================
  Navigator.cpp
===============================================================================

  Every tick:
    1) feed the history buffer (once primed) and compute the smoothed value
    2) run the handler for the current phase
    3) return the drive actions that phase asked for

  Obstacle and wrong-way interrupts are handled inside the tick that saw
  the triggering sample.

  Debug lines print reflectance in tenths; AVR printf has no %f.
===============================================================================
*/

namespace nav {

const char* phaseName(NavPhase p) {
  switch (p) {
    case NavPhase::INIT:               return "INIT";
    case NavPhase::WARMUP:             return "WARMUP";
    case NavPhase::SEARCHING:          return "SEARCHING";
    case NavPhase::OBSTACLE_RECOVERY:  return "OBSTACLE_RECOVERY";
    case NavPhase::WRONG_WAY_RECOVERY: return "WRONG_WAY_RECOVERY";
    case NavPhase::ARRIVED:            return "ARRIVED";
    case NavPhase::DONE:               return "DONE";
    default:                           return "UNKNOWN";
  }
}

}  // namespace nav

static int tenths(float v) {
  return (int)(v * 10.0f + ((v < 0.0f) ? -0.5f : 0.5f));
}


Navigator::Navigator(const NavConfig& cfg, StatusReporter& status)
: _cfg(cfg),
  _status(status),
  _classifier(cfg.classifier),
  _guard(cfg.stop_distance_mm)
{
}

void Navigator::begin(const TargetSelection& selection) {
  _selection = selection;
  _state = RunState();
  _sample = SensorSample();
  _filter.reset();
  _begun = true;

  _status.start(scenario::name(_selection.scenario));
  _status.targetColor(_selection.target);

  _status.debug("config cal=%d/%d/%d tol=%d policy=%s (x10)",
                tenths(_cfg.classifier.calibration[SLOT_FIRST]),
                tenths(_cfg.classifier.calibration[SLOT_MIDDLE]),
                tenths(_cfg.classifier.calibration[SLOT_LAST]),
                tenths(_cfg.classifier.tolerance),
                (_cfg.classifier.policy == FallbackPolicy::NEAREST) ? "NEAREST" : "WINDOW");
}

void Navigator::cancel() {
  // The final push has already seated the robot; let the arrival finish
  if (active() && _state.phase != NavPhase::ARRIVED) _state.cancel_requested = true;
}

bool Navigator::visited(Color zone) const {
  const int8_t slot = _cfg.classifier.board.slotOf(zone);
  if (slot == SLOT_NONE) return false;
  return (_state.visited & zones::slotBit((uint8_t)slot)) != 0;
}

int16_t Navigator::runSpeedDps() const {
  return _selection.hazard ? _cfg.turbo_speed_dps : _cfg.drive_speed_dps;
}

DriveActions Navigator::step(const SensorSample& sample) {
  DriveActions act;
  if (!_begun || finished()) return act;

  _state.ticks++;
  _sample = sample;

  if (_state.cancel_requested && _state.phase != NavPhase::ARRIVED) {
    cancelRun_(act);
    return act;
  }

  // The buffer is primed in INIT; after that every real reading goes in
  if (_filter.primed() && _sample.reflectance_valid) {
    _sample.smoothed_reflectance = _filter.push(_sample.raw_reflectance);
  } else {
    _sample.smoothed_reflectance = _filter.mean();
  }

  switch (_state.phase) {
    case NavPhase::INIT:
      stepInit_(act);
      break;

    case NavPhase::OBSTACLE_RECOVERY:
    case NavPhase::WRONG_WAY_RECOVERY:
      // Turn-around has been executed; start a fresh warmup window
      _state.phase = NavPhase::WARMUP;
      stepWarmup_(act);
      break;

    case NavPhase::WARMUP:
      stepWarmup_(act);
      break;

    case NavPhase::SEARCHING:
      stepSearching_(act);
      break;

    case NavPhase::ARRIVED:
      // Final push has been executed
      arrive_(act);
      break;

    case NavPhase::DONE:
    default:
      break;
  }

  return act;
}

/*=============================================================================
  PHASE HANDLERS
=============================================================================*/

void Navigator::stepInit_(DriveActions& act) {
  // Wait for a real reading; a zero prefill would skew the first averages
  if (!_sample.reflectance_valid) {
    _status.debug("init waiting for reflectance");
    return;
  }

  _filter.prefill(_sample.raw_reflectance);
  _sample.smoothed_reflectance = _filter.mean();

  Color start_zone;
  const bool known = _classifier.classify(_sample, start_zone);
  _state.zone = start_zone;
  _state.zone_valid = known;

  _status.debug("start read=%d col=%s zone=%s",
                _sample.raw_reflectance,
                _sample.color_valid ? zones::colorName(_sample.color) : "NONE",
                known ? zones::colorName(start_zone) : "NONE");

  if (known && start_zone == _selection.target) {
    _status.debug("already on target %s, skipping drive", zones::colorName(start_zone));
    _state.arrived_by_precheck = true;
    _state.phase = NavPhase::ARRIVED;
    arrive_(act);
    return;
  }

  _state.phase = NavPhase::WARMUP;
  act.drive = true;
  act.drive_speed_dps = runSpeedDps();
}

void Navigator::stepWarmup_(DriveActions& act) {
  countSample_();

  if (_guard.check(_sample.distance_valid, _sample.distance_mm)) {
    enterRecovery_(NavPhase::OBSTACLE_RECOVERY, act);
    return;
  }

  // Ignore whatever we see while leaving the start zone
  _state.consecutive_hits = 0;
  _state.zone_valid = false;
  _state.zone = Color::NONE;

  if (_state.sample_counter >= _cfg.warmup_samples) {
    _state.phase = NavPhase::SEARCHING;
  }
}

void Navigator::stepSearching_(DriveActions& act) {
  countSample_();

  if (_guard.check(_sample.distance_valid, _sample.distance_mm)) {
    enterRecovery_(NavPhase::OBSTACLE_RECOVERY, act);
    return;
  }

  Color zone;
  const bool known = _classifier.classify(_sample, zone);
  _state.zone = zone;
  _state.zone_valid = known;

  if (!known) {
    _state.consecutive_hits = 0;
    return;
  }

  const uint8_t slot = (uint8_t)_cfg.classifier.board.slotOf(zone);
  _state.visited |= zones::slotBit(slot);

  if (zone == _selection.target) {
    if (_state.consecutive_hits < 0xFF) _state.consecutive_hits++;
  } else {
    _state.consecutive_hits = 0;
  }

  if (_state.consecutive_hits >= _cfg.hit_threshold) {
    _status.debug("sensor reached %s, pushing rest of robot in", zones::colorName(zone));
    _state.phase = NavPhase::ARRIVED;
    act.final_push = true;
    return;
  }

  if (wrongWay_(slot)) {
    enterRecovery_(NavPhase::WRONG_WAY_RECOVERY, act);
  }
}

/*=============================================================================
  TRANSITIONS
=============================================================================*/

void Navigator::enterRecovery_(NavPhase phase, DriveActions& act) {
  act.stop = true;

  if (phase == NavPhase::OBSTACLE_RECOVERY) {
    _status.abortObstacle(_sample.distance_mm);
    act.alert = true;
    _state.obstacle_recoveries++;
  } else {
    _status.wrongWay(_selection.target);
    _state.wrong_way_recoveries++;
  }

  _status.turnAround();
  act.turn_around = true;

  resetProgress_();

  act.drive = true;
  act.drive_speed_dps = runSpeedDps();

  _state.phase = phase;
}

void Navigator::arrive_(DriveActions& act) {
  _status.reached(_selection.target);
  _status.zone(scenario::name(_selection.scenario));

  _state.phase = NavPhase::DONE;
  _status.done();
  act.confirm = true;
}

void Navigator::cancelRun_(DriveActions& act) {
  act.stop = true;
  _state.cancelled = true;
  _state.phase = NavPhase::DONE;
  _status.cancelled();
}

/*=============================================================================
  HELPERS
=============================================================================*/

bool Navigator::wrongWay_(uint8_t slot) const {
  const uint8_t v = _state.visited;
  const bool seen_first  = (v & zones::slotBit(SLOT_FIRST)) != 0;
  const bool seen_middle = (v & zones::slotBit(SLOT_MIDDLE)) != 0;
  const bool seen_last   = (v & zones::slotBit(SLOT_LAST)) != 0;

  switch (_selection.target_slot) {
    case SLOT_FIRST:
      return slot == SLOT_LAST && seen_middle && !seen_first;

    case SLOT_LAST:
      return slot == SLOT_FIRST && seen_middle && !seen_last;

    case SLOT_MIDDLE:
      return seen_first && seen_last && _state.consecutive_hits == 0;

    default:
      return false;
  }
}

void Navigator::resetProgress_() {
  _state.visited = 0;
  _state.consecutive_hits = 0;
  _state.sample_counter = 0;
  _state.zone = Color::NONE;
  _state.zone_valid = false;
}

void Navigator::countSample_() {
  if (_state.sample_counter < 0xFFFF) _state.sample_counter++;
}
