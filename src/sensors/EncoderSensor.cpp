#include "sensors/EncoderSensor.h"

/*
  EncoderSensor.cpp

  The Encoder library gives raw signed counts from its interrupt handlers.
  This wrapper applies wheel polarity and converts counts to degrees.
*/

EncoderSensor::EncoderSensor(uint8_t pin_a,
                             uint8_t pin_b,
                             float counts_per_wheel_rev,
                             bool invert_direction)
: _enc(pin_a, pin_b),
  _invert_direction(invert_direction)
{
  _counts_per_wheel_rev = (counts_per_wheel_rev > 0.0f) ? counts_per_wheel_rev : 1.0f;
}

void EncoderSensor::begin() {
  zero();
}

int32_t EncoderSensor::count() {
  const int32_t raw = (int32_t)_enc.read();
  return _invert_direction ? -raw : raw;
}

float EncoderSensor::degrees() {
  return (float)count() * 360.0f / _counts_per_wheel_rev;
}

void EncoderSensor::zero() {
  _enc.write(0);
}
