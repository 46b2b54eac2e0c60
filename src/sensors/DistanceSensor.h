#pragma once

#include <Arduino.h>

// Forward declaration: we only store a pointer in the header
class UltraSonicDistanceSensor;

/*
  DistanceSensor

  Forward-looking HC-SR04 for the obstacle guard. measure() takes one
  reading right away (the navigation tick is the rate limiter) and keeps
  it in State for telemetry.
*/
class DistanceSensor {
public:
  struct State {
    int   distance_mm = 0;          // last valid distance
    bool  valid = false;            // last reading valid?
    uint32_t last_update_ms = 0;    // millis() at last measurement
    float distance_cm = -1.0f;      // last raw library value (-1 if invalid)
  };

  // max_distance_cm / max_timeout_us are passed through to the library.
  // Readings outside [min_valid_mm, max_valid_mm] are marked invalid.
  DistanceSensor(uint8_t trig_pin,
                 uint8_t echo_pin,
                 uint16_t max_distance_cm = 100,
                 uint32_t max_timeout_us = 12000,
                 uint16_t min_valid_mm = 20,
                 uint16_t max_valid_mm = 1000);

  ~DistanceSensor();

  void begin();                       // consistency hook (library sets pinMode in ctor)

  // Measure now. Returns true and sets out_mm if the reading is valid.
  bool measure(uint32_t now_ms, int& out_mm);

  const State& getState() const { return _state; }

  uint32_t ageMs(uint32_t now_ms) const { return now_ms - _state.last_update_ms; }

private:
  uint16_t _min_valid_mm;
  uint16_t _max_valid_mm;

  State _state;

  UltraSonicDistanceSensor* _sonar = nullptr;
};
