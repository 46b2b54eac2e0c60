#include "actuators/DriveTrain.h"
#include <math.h>  // fabsf

DriveTrain::DriveTrain(DcMotorActuator& left_motor,
                       DcMotorActuator& right_motor,
                       EncoderSensor& left_encoder,
                       EncoderSensor& right_encoder,
                       float max_wheel_dps,
                       uint32_t move_timeout_ms)
: _left(left_motor, left_encoder),
  _right(right_motor, right_encoder),
  _max_wheel_dps((max_wheel_dps > 0.0f) ? max_wheel_dps : 1.0f),
  _move_timeout_ms(move_timeout_ms)
{
}

void DriveTrain::begin() {
  _left.motor.begin();
  _right.motor.begin();
  _left.encoder.begin();
  _right.encoder.begin();
}

float DriveTrain::dpsToDuty_(int16_t dps) const {
  return (float)dps / _max_wheel_dps;
}

void DriveTrain::runContinuous(int16_t left_dps, int16_t right_dps) {
  // A continuous command replaces any angle move in progress
  _left.move.active = false;
  _right.move.active = false;

  _left.motor.setDuty(dpsToDuty_(left_dps));
  _right.motor.setDuty(dpsToDuty_(right_dps));
}

void DriveTrain::runForAngle(Side side, int16_t speed_dps, int32_t degrees,
                             bool brake, bool wait) {
  Wheel& w = wheel_(side);

  if (speed_dps != 0 && degrees != 0) {
    // Direction follows sign(speed) * sign(degrees)
    const bool reverse = (speed_dps < 0) != (degrees < 0);
    const float duty = fabsf(dpsToDuty_(speed_dps));

    w.encoder.zero();
    w.move.active = true;
    w.move.target_deg = fabsf((float)degrees);
    w.move.brake = brake;
    w.move.started_ms = millis();

    w.motor.setDuty(reverse ? -duty : duty);
  } else {
    w.move.active = false;
    w.motor.stop(brake);
  }

  if (wait) waitForMoves_();
}

void DriveTrain::stopAll() {
  _left.move.active = false;
  _right.move.active = false;

  _left.motor.stop(true);
  _right.motor.stop(true);
}

void DriveTrain::service(uint32_t now_ms) {
  serviceWheel_(_left, now_ms);
  serviceWheel_(_right, now_ms);
}

bool DriveTrain::moving() const {
  return _left.move.active || _right.move.active;
}

void DriveTrain::serviceWheel_(Wheel& w, uint32_t now_ms) {
  if (!w.move.active) return;

  if (fabsf(w.encoder.degrees()) >= w.move.target_deg) {
    w.move.active = false;
    w.motor.stop(w.move.brake);
    return;
  }

  // Stalled wheel: give up rather than block the robot forever
  if ((uint32_t)(now_ms - w.move.started_ms) > _move_timeout_ms) {
    w.move.active = false;
    w.motor.stop(false);
    _timeouts++;
  }
}

void DriveTrain::waitForMoves_() {
  while (moving()) {
    service(millis());
    delay(1);
  }
}
