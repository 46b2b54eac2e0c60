#pragma once
#include <stdint.h>

#include "nav/Zone.h"

/*
===============================================================================
  NavConfig.h
===============================================================================

  PURPOSE
  -------
  Every tunable the navigation core uses. Nothing in nav/ reads Params.h;
  the firmware fills a NavConfig from Params.h in main.cpp and tests build
  their own.

  Units:
    - Speeds: wheel degrees per second (signed)
    - Angles: wheel degrees
    - Distances: millimeters
    - Reflectance: sensor percent (0..100)
===============================================================================
*/

// How the reflectance fallback resolves a zone
enum class FallbackPolicy : uint8_t {
  TOLERANCE_WINDOW = 0,   // must sit within +/- tolerance of exactly one zone
  NEAREST,                // closest calibration value wins, ties -> lowest slot
};

// What happens to a command that is not in the scenario table
enum class UnknownCommandPolicy : uint8_t {
  REJECT = 0,             // no run is started
  DEFAULT_ZONE,           // run the scenario that targets default_slot
};

struct ClassifierConfig {
  BoardLayout board;

  // Reference reflectance per slot (same order as board.order)
  float calibration[ZONE_COUNT] = {0.0f, 0.0f, 0.0f};

  float tolerance = 0.0f;

  // Smoothed readings outside [valid_min, valid_max] are rejected
  float valid_min = 0.0f;
  float valid_max = 0.0f;

  FallbackPolicy policy = FallbackPolicy::TOLERANCE_WINDOW;
};

struct NavConfig {
  ClassifierConfig classifier;

  int16_t drive_speed_dps = 0;
  int16_t turbo_speed_dps = 0;      // hazard mode

  uint16_t sample_period_ms = 0;
  uint8_t  hit_threshold = 0;       // consecutive target samples to confirm
  uint16_t warmup_samples = 0;      // samples ignored after every (re)start

  uint16_t stop_distance_mm = 0;

  int32_t final_drive_angle_deg = 0;
  int32_t turn_angle_deg = 0;       // per wheel, opposite directions
  int16_t turn_speed_dps = 0;

  uint16_t settle_ms = 0;           // sensor stabilization before Init
  uint16_t turn_settle_ms = 0;      // pause after a turn-around

  uint16_t effect_phase_ms = 0;     // siren half period

  UnknownCommandPolicy unknown_policy = UnknownCommandPolicy::REJECT;
  uint8_t default_slot = SLOT_FIRST;

  bool debug_enabled = false;

  // Repairs values that would make the state machine misbehave
  // (zero counts, swapped ranges, negative magnitudes). Returns the number
  // of fields that were changed.
  uint8_t sanitize();
};
