#include "sensors/DistanceSensor.h"
#include <HCSR04.h>  // Martinsos library

/*
  DistanceSensor.cpp

  This is a simple wrapper around the Martinsos HC-SR04 library.

  Responsibilities:
  - Take a measurement when measure() is called
  - Convert cm to mm
  - Validate the reading
  - Store the latest state for telemetry
*/

DistanceSensor::DistanceSensor(uint8_t trig_pin,
                               uint8_t echo_pin,
                               uint16_t max_distance_cm,
                               uint32_t max_timeout_us,
                               uint16_t min_valid_mm,
                               uint16_t max_valid_mm)
: _min_valid_mm(min_valid_mm),
  _max_valid_mm(max_valid_mm)
{
  if (_max_valid_mm < _min_valid_mm) {
    uint16_t tmp = _max_valid_mm;
    _max_valid_mm = _min_valid_mm;
    _min_valid_mm = tmp;
  }

  // Martinsos constructor sets pinMode() internally
  _sonar = new UltraSonicDistanceSensor(
      trig_pin,
      echo_pin,
      max_distance_cm,
      max_timeout_us
  );
}

DistanceSensor::~DistanceSensor() {
  if (_sonar) {
    delete _sonar;
    _sonar = nullptr;
  }
}

void DistanceSensor::begin() {
  // Nothing required here, but kept for consistency
}

bool DistanceSensor::measure(uint32_t now_ms, int& out_mm) {
  _state.last_update_ms = now_ms;

  if (!_sonar) {
    _state.valid = false;
    _state.distance_cm = -1.0f;
    return false;
  }

  const float cm = _sonar->measureDistanceCm();
  _state.distance_cm = cm;

  // Library returns -1.0 when invalid (timeout or out of range)
  if (cm <= 0.0f) {
    _state.valid = false;
    return false;
  }

  const int mm = (int)(cm * 10.0f + 0.5f);

  if (mm < (int)_min_valid_mm || mm > (int)_max_valid_mm) {
    _state.valid = false;
    return false;
  }

  _state.distance_mm = mm;
  _state.valid = true;
  out_mm = mm;
  return true;
}
