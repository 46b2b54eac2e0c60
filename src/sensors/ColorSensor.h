#pragma once
#include <Arduino.h>

#include "nav/Zone.h"

/*
===============================================================================
  ColorSensor.h
===============================================================================

  PURPOSE
  -------
  TCS3200 light-to-frequency sensor pointing down at the board.

  Provides the two independent readings the zone classifier fuses:
    - readColor()      : discrete color from R/G/B channel dominance
    - readReflection() : clear-channel brightness as a 0..100 percent

  readAmbient() is for calibration only: same clear-channel percent with
  the LED briefly off.

  TCS3200 filter truth table (S2, S3):
    LOW,  LOW  -> red
    LOW,  HIGH -> blue
    HIGH, LOW  -> clear (no filter)
    HIGH, HIGH -> green

  Output frequency scaling is fixed at 20% (S0 HIGH, S1 LOW).
  Periods are measured with pulseIn(); shorter period = more light.
===============================================================================
*/

class ColorSensor {
public:
  struct Calibration {
    uint32_t clear_white_us = 40;      // clear channel period on white
    uint32_t clear_black_us = 900;     // clear channel period on black
    uint32_t rgb_white_us = 60;
    uint32_t rgb_black_us = 1200;
    float    dominance = 1.25f;
    uint16_t min_intensity_sum = 120;
  };

  struct State {
    uint32_t r_us = 0;
    uint32_t g_us = 0;
    uint32_t b_us = 0;
    uint32_t clear_us = 0;
    int reflection_pct = -1;   // -1 if the last read failed
    int ambient_pct = -1;
    Color color = Color::NONE;
  };

  ColorSensor(uint8_t pin_s0,
              uint8_t pin_s1,
              uint8_t pin_s2,
              uint8_t pin_s3,
              uint8_t pin_out,
              uint8_t pin_led,
              uint32_t pulse_timeout_us,
              const Calibration& cal);

  void begin();

  // False on timeout or when no channel clearly dominates
  bool readColor(Color& out);

  // False on timeout
  bool readReflection(int& out_percent);

  // LED off for one clear reading, then back on. False on timeout.
  bool readAmbient(int& out_percent);

  const State& getState() const { return _state; }

private:
  enum class Channel : uint8_t { RED, GREEN, BLUE, CLEAR };

  // Period in microseconds, 0 on timeout
  uint32_t readPeriod_(Channel ch);

  // Period -> 0..scale intensity (scale = brighter)
  static long toIntensity_(uint32_t period_us, uint32_t white_us, uint32_t black_us, long scale);

  uint8_t _pin_s0;
  uint8_t _pin_s1;
  uint8_t _pin_s2;
  uint8_t _pin_s3;
  uint8_t _pin_out;
  uint8_t _pin_led;

  uint32_t _pulse_timeout_us;
  Calibration _cal;

  State _state;
};
