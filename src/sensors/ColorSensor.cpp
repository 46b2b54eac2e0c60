#include "sensors/ColorSensor.h"

/*
  ColorSensor.cpp

  Color naming uses channel dominance on normalized intensities:
    - too dark overall          -> no color
    - red and green both beat blue by the dominance factor and are
      within it of each other   -> YELLOW
    - one channel beats both others by the dominance factor -> that color
    - otherwise                 -> no color (let reflectance decide)
*/

static constexpr uint32_t LED_OFF_SETTLE_MS = 5;

ColorSensor::ColorSensor(uint8_t pin_s0,
                         uint8_t pin_s1,
                         uint8_t pin_s2,
                         uint8_t pin_s3,
                         uint8_t pin_out,
                         uint8_t pin_led,
                         uint32_t pulse_timeout_us,
                         const Calibration& cal)
: _pin_s0(pin_s0),
  _pin_s1(pin_s1),
  _pin_s2(pin_s2),
  _pin_s3(pin_s3),
  _pin_out(pin_out),
  _pin_led(pin_led),
  _pulse_timeout_us(pulse_timeout_us),
  _cal(cal)
{
}

void ColorSensor::begin() {
  pinMode(_pin_s0, OUTPUT);
  pinMode(_pin_s1, OUTPUT);
  pinMode(_pin_s2, OUTPUT);
  pinMode(_pin_s3, OUTPUT);
  pinMode(_pin_led, OUTPUT);
  pinMode(_pin_out, INPUT);

  // Frequency scaling: S0=HIGH, S1=LOW => 20%
  digitalWrite(_pin_s0, HIGH);
  digitalWrite(_pin_s1, LOW);

  // Constant illumination so reflectance does not follow room light
  digitalWrite(_pin_led, HIGH);
}

uint32_t ColorSensor::readPeriod_(Channel ch) {
  switch (ch) {
    case Channel::RED:   digitalWrite(_pin_s2, LOW);  digitalWrite(_pin_s3, LOW);  break;
    case Channel::BLUE:  digitalWrite(_pin_s2, LOW);  digitalWrite(_pin_s3, HIGH); break;
    case Channel::CLEAR: digitalWrite(_pin_s2, HIGH); digitalWrite(_pin_s3, LOW);  break;
    case Channel::GREEN: digitalWrite(_pin_s2, HIGH); digitalWrite(_pin_s3, HIGH); break;
  }

  // Let the photodiode array switch filters
  delayMicroseconds(100);
  return (uint32_t)pulseIn(_pin_out, LOW, _pulse_timeout_us);
}

long ColorSensor::toIntensity_(uint32_t period_us, uint32_t white_us, uint32_t black_us, long scale) {
  if (black_us <= white_us) return 0;

  const long p = constrain((long)period_us, (long)white_us, (long)black_us);
  return map(p, (long)white_us, (long)black_us, scale, 0L);
}

bool ColorSensor::readReflection(int& out_percent) {
  const uint32_t period = readPeriod_(Channel::CLEAR);
  _state.clear_us = period;

  if (period == 0) {
    _state.reflection_pct = -1;
    return false;
  }

  const int pct = (int)toIntensity_(period, _cal.clear_white_us, _cal.clear_black_us, 100L);
  _state.reflection_pct = pct;
  out_percent = pct;
  return true;
}

bool ColorSensor::readAmbient(int& out_percent) {
  digitalWrite(_pin_led, LOW);
  delay(LED_OFF_SETTLE_MS);

  const uint32_t period = readPeriod_(Channel::CLEAR);
  digitalWrite(_pin_led, HIGH);

  if (period == 0) {
    _state.ambient_pct = -1;
    return false;
  }

  const int pct = (int)toIntensity_(period, _cal.clear_white_us, _cal.clear_black_us, 100L);
  _state.ambient_pct = pct;
  out_percent = pct;
  return true;
}

bool ColorSensor::readColor(Color& out) {
  _state.r_us = readPeriod_(Channel::RED);
  _state.g_us = readPeriod_(Channel::GREEN);
  _state.b_us = readPeriod_(Channel::BLUE);
  _state.color = Color::NONE;

  if (_state.r_us == 0 || _state.g_us == 0 || _state.b_us == 0) return false;

  const float r = (float)toIntensity_(_state.r_us, _cal.rgb_white_us, _cal.rgb_black_us, 255L);
  const float g = (float)toIntensity_(_state.g_us, _cal.rgb_white_us, _cal.rgb_black_us, 255L);
  const float b = (float)toIntensity_(_state.b_us, _cal.rgb_white_us, _cal.rgb_black_us, 255L);

  if (r + g + b < (float)_cal.min_intensity_sum) return false;

  const float k = _cal.dominance;

  // Yellow reflects red and green about equally, little blue
  if (r > b * k && g > b * k && r < g * k && g < r * k) {
    _state.color = Color::YELLOW;
  } else if (r > g * k && r > b * k) {
    _state.color = Color::RED;
  } else if (g > r * k && g > b * k) {
    _state.color = Color::GREEN;
  } else if (b > r * k && b > g * k) {
    _state.color = Color::BLUE;
  } else {
    return false;
  }

  out = _state.color;
  return true;
}
