#pragma once
#include <Arduino.h>
#include <Encoder.h>  // Paul Stoffregen Encoder library

/*
===============================================================================
  EncoderSensor.h
===============================================================================

  PURPOSE
  -------
  Wheel odometry for angle moves (turn-around, final push).

  Wraps the Encoder library and reports signed wheel degrees since the
  last zero(). Angle moves zero the encoder at the start and poll
  degrees() until the target is reached.

  IMPORTANT
  ---------
  counts_per_wheel_rev must include gearing and quadrature decoding.
===============================================================================
*/

class EncoderSensor {
public:
  EncoderSensor(uint8_t pin_a,
                uint8_t pin_b,
                float counts_per_wheel_rev,
                bool invert_direction = false);

  void begin();

  // Signed counts, forward positive
  int32_t count();

  // Signed wheel degrees since the last zero()
  float degrees();

  void zero();

private:
  Encoder _enc;

  float _counts_per_wheel_rev;
  bool _invert_direction;
};
