#pragma once
#include <Arduino.h>

/*
===============================================================================
  DcMotorActuator.h
===============================================================================

  PURPOSE
  -------
  Thin hardware wrapper for one drive motor on a DRV8871.

  Assumed wiring (see Pins.h):
    - IN1 = direction GPIO
    - IN2 = PWM GPIO

  Responsibilities:
    - Accept normalized duty in [-1.0, +1.0]
    - Lift small non-zero duties to min_moving_duty so slow crawl speeds
      still turn the wheel
    - Stop by braking (hold) or coasting

  Notes:
    - Open loop. Angle moves are closed by DriveTrain using the encoders.
===============================================================================
*/

class DcMotorActuator {
public:
  /*
    invert:
      flips sign of commanded duty (mirrored side of the chassis)

    min_moving_duty:
      smallest |duty| actually sent when duty != 0
  */
  DcMotorActuator(uint8_t pin_dir,
                  uint8_t pin_pwm,
                  bool invert = false,
                  float min_moving_duty = 0.0f,
                  uint8_t pwm_min = 0,
                  uint8_t pwm_max = 255);

  // Configure GPIO and start coasting.
  void begin();

  /*
    duty:
      -1.0 = full reverse
       0.0 = coast
      +1.0 = full forward
  */
  void setDuty(float duty);

  // brake = true holds the wheel (IN1=IN2=HIGH), false lets it coast
  void stop(bool brake);

  float dutyCmd() const { return _duty_cmd; }
  int pwmCmd() const { return _pwm_cmd; }
  bool braking() const { return _braking; }

private:
  float shapeDuty_(float d) const;
  uint8_t dutyToPwm_(float abs_duty) const;

  uint8_t _pin_dir;
  uint8_t _pin_pwm;

  bool _invert;
  float _min_moving_duty;

  uint8_t _pwm_min;
  uint8_t _pwm_max;

  // Last command values (telemetry/debug)
  float _duty_cmd = 0.0f;
  int _pwm_cmd = 0;
  bool _braking = false;
};
