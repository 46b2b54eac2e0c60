#include "actuators/DcMotorActuator.h"
#include <math.h>  // fabsf

/*
===============================================================================
  DcMotorActuator.cpp
===============================================================================

  DRV8871 truth table (IN1 direction, PWM on IN2):
    - IN1=0, IN2=0   -> Coast
    - IN1=1, IN2=1   -> Brake
    - IN1=1, IN2=PWM -> Forward
    - IN1=0, IN2=PWM -> Reverse
===============================================================================
*/

DcMotorActuator::DcMotorActuator(uint8_t pin_dir,
                                 uint8_t pin_pwm,
                                 bool invert,
                                 float min_moving_duty,
                                 uint8_t pwm_min,
                                 uint8_t pwm_max)
: _pin_dir(pin_dir),
  _pin_pwm(pin_pwm),
  _invert(invert),
  _min_moving_duty(constrain(min_moving_duty, 0.0f, 1.0f)),
  _pwm_min(pwm_min),
  _pwm_max(pwm_max)
{
  if (_pwm_max < _pwm_min) {
    uint8_t tmp = _pwm_max;
    _pwm_max = _pwm_min;
    _pwm_min = tmp;
  }
}

void DcMotorActuator::begin() {
  pinMode(_pin_dir, OUTPUT);
  pinMode(_pin_pwm, OUTPUT);
  stop(false);
}

float DcMotorActuator::shapeDuty_(float d) const {
  if (d > 1.0f) d = 1.0f;
  if (d < -1.0f) d = -1.0f;
  if (d == 0.0f) return 0.0f;

  const float mag = fabsf(d);
  if (mag < _min_moving_duty) {
    return (d > 0.0f) ? _min_moving_duty : -_min_moving_duty;
  }
  return d;
}

uint8_t DcMotorActuator::dutyToPwm_(float abs_duty) const {
  if (abs_duty <= 0.0f) return 0;

  const float span = (float)(_pwm_max - _pwm_min);
  const int pwm = (int)(_pwm_min + abs_duty * span + 0.5f);
  return (uint8_t)constrain(pwm, 0, 255);
}

void DcMotorActuator::setDuty(float duty) {
  duty = shapeDuty_(duty);
  if (_invert) duty = -duty;

  if (duty == 0.0f) {
    stop(false);
    return;
  }

  digitalWrite(_pin_dir, (duty > 0.0f) ? HIGH : LOW);

  const uint8_t pwm = dutyToPwm_(fabsf(duty));
  analogWrite(_pin_pwm, pwm);

  _duty_cmd = duty;
  _pwm_cmd = (int)pwm;
  _braking = false;
}

void DcMotorActuator::stop(bool brake) {
  digitalWrite(_pin_dir, brake ? HIGH : LOW);
  analogWrite(_pin_pwm, brake ? 255 : 0);

  _duty_cmd = 0.0f;
  _pwm_cmd = brake ? 255 : 0;
  _braking = brake;
}
