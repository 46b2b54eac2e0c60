#pragma once
#include <stdint.h>

#include "nav/Zone.h"

/*
  One sampling tick worth of sensor data.

  Optional readings are a value plus a valid flag. The smoothed reflectance
  is filled in by the Navigator from its history buffer; callers leave it 0.
*/
struct SensorSample {
  Color color = Color::NONE;
  bool  color_valid = false;

  int   raw_reflectance = 0;
  bool  reflectance_valid = false;
  float smoothed_reflectance = 0.0f;

  int   distance_mm = 0;
  bool  distance_valid = false;
};
