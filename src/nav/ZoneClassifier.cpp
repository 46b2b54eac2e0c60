#include "nav/ZoneClassifier.h"

ZoneClassifier::ZoneClassifier(const ClassifierConfig& cfg)
: _cfg(cfg)
{
}

bool ZoneClassifier::classify(const SensorSample& s, Color& out_zone) const {
  out_zone = Color::NONE;

  if (s.color_valid && fromColor(s.color, out_zone)) {
    return true;
  }

  if (!s.reflectance_valid) return false;

  return fromReflectance(s.smoothed_reflectance, out_zone);
}

bool ZoneClassifier::fromColor(Color c, Color& out_zone) const {
  out_zone = Color::NONE;
  if (!_cfg.board.contains(c)) return false;

  out_zone = c;
  return true;
}

bool ZoneClassifier::fromReflectance(float smoothed, Color& out_zone) const {
  out_zone = Color::NONE;

  // Clamp out spurious sensor values before any matching
  if (smoothed < _cfg.valid_min || smoothed > _cfg.valid_max) {
    return false;
  }

  if (_cfg.policy == FallbackPolicy::NEAREST) {
    return nearest_(smoothed, out_zone);
  }
  return withinTolerance_(smoothed, out_zone);
}

bool ZoneClassifier::withinTolerance_(float smoothed, Color& out_zone) const {
  uint8_t matches = 0;
  uint8_t match_slot = 0;

  for (uint8_t i = 0; i < ZONE_COUNT; i++) {
    if (distance_(smoothed, _cfg.calibration[i]) <= _cfg.tolerance) {
      matches++;
      match_slot = i;
    }
  }

  // Overlapping windows are ambiguous, not a tie to break
  if (matches != 1) return false;

  out_zone = _cfg.board.at(match_slot);
  return out_zone != Color::NONE;
}

bool ZoneClassifier::nearest_(float smoothed, Color& out_zone) const {
  uint8_t best_slot = 0;
  float best = distance_(smoothed, _cfg.calibration[0]);

  // Strict '<' keeps the first-declared slot on ties
  for (uint8_t i = 1; i < ZONE_COUNT; i++) {
    const float d = distance_(smoothed, _cfg.calibration[i]);
    if (d < best) {
      best = d;
      best_slot = i;
    }
  }

  out_zone = _cfg.board.at(best_slot);
  return out_zone != Color::NONE;
}
