#include "nav/NavConfig.h"

/*
  sanitize() only touches values that cannot work at all. Calibration
  constants are left alone: a bad calibration shows up as "no zone",
  which the navigator already handles.
*/

// -INT16_MIN does not fit; clamp it to the largest magnitude instead
static int16_t absSpeed(int16_t v) {
  if (v == INT16_MIN) return INT16_MAX;
  return (v < 0) ? (int16_t)-v : v;
}

static int32_t absAngle(int32_t v) {
  if (v == INT32_MIN) return INT32_MAX;
  return (v < 0) ? -v : v;
}

uint8_t NavConfig::sanitize() {
  uint8_t fixed = 0;

  // Guard against swapped bounds
  if (classifier.valid_max < classifier.valid_min) {
    float tmp = classifier.valid_max;
    classifier.valid_max = classifier.valid_min;
    classifier.valid_min = tmp;
    fixed++;
  }

  if (classifier.tolerance < 0.0f) {
    classifier.tolerance = -classifier.tolerance;
    fixed++;
  }

  if (hit_threshold == 0) {
    hit_threshold = 1;
    fixed++;
  }

  if (sample_period_ms == 0) {
    sample_period_ms = 1;
    fixed++;
  }

  if (effect_phase_ms == 0) {
    effect_phase_ms = 1;
    fixed++;
  }

  if (default_slot >= ZONE_COUNT) {
    default_slot = SLOT_FIRST;
    fixed++;
  }

  // Forward motion is positive; direction is decided by the caller
  if (drive_speed_dps < 0) { drive_speed_dps = absSpeed(drive_speed_dps); fixed++; }
  if (turbo_speed_dps < 0) { turbo_speed_dps = absSpeed(turbo_speed_dps); fixed++; }
  if (turn_speed_dps < 0)  { turn_speed_dps = absSpeed(turn_speed_dps);   fixed++; }

  if (final_drive_angle_deg < 0) { final_drive_angle_deg = absAngle(final_drive_angle_deg); fixed++; }
  if (turn_angle_deg < 0)        { turn_angle_deg = absAngle(turn_angle_deg);               fixed++; }

  return fixed;
}
