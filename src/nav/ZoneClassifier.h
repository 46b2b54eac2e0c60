#pragma once
#include <stdint.h>

#include "nav/NavConfig.h"
#include "nav/SensorSample.h"

/*
===============================================================================
  ZoneClassifier.h
===============================================================================

  PURPOSE
  -------
  Fuses the two color sensing methods into one zone label.

  Stage 1 (high confidence):
    The sensor's discrete color is one of the board's three colors.
    Returned as-is, reflectance is not consulted.

  Stage 2 (fallback, only if stage 1 found nothing):
    - reflectance missing, or smoothed value outside [valid_min, valid_max]
      -> no zone
    - TOLERANCE_WINDOW: within +/- tolerance of exactly one calibration
      value -> that zone; zero or several -> no zone
    - NEAREST: smallest |smoothed - calibration|, ties -> lowest slot

  All methods return false for "no zone" and leave out_zone as Color::NONE.
===============================================================================
*/

class ZoneClassifier {
public:
  explicit ZoneClassifier(const ClassifierConfig& cfg);

  bool classify(const SensorSample& s, Color& out_zone) const;

  // Stage 1 only
  bool fromColor(Color c, Color& out_zone) const;

  // Stage 2 only
  bool fromReflectance(float smoothed, Color& out_zone) const;

  const ClassifierConfig& config() const { return _cfg; }

private:
  bool withinTolerance_(float smoothed, Color& out_zone) const;
  bool nearest_(float smoothed, Color& out_zone) const;

  static float distance_(float a, float b) { return (a > b) ? (a - b) : (b - a); }

  ClassifierConfig _cfg;
};
