#pragma once
#include <Arduino.h>

#include "actuators/DcMotorActuator.h"
#include "nav/Ports.h"
#include "sensors/EncoderSensor.h"

/*
===============================================================================
  DriveTrain.h
===============================================================================

  PURPOSE
  -------
  DrivePort for the two-wheeled base.

    runContinuous : open-loop duty from the requested wheel deg/s
    runForAngle   : zero the wheel's encoder, drive until |degrees| is
                    covered, then brake or coast
    stopAll       : brake both wheels, cancel pending angle moves

  A blocking runForAngle (wait = true) returns when every pending angle
  move is finished, so the turn-around's two wheels complete together.
  Moves that exceed move_timeout_ms are abandoned (coast) and counted.
===============================================================================
*/

class DriveTrain : public DrivePort {
public:
  DriveTrain(DcMotorActuator& left_motor,
             DcMotorActuator& right_motor,
             EncoderSensor& left_encoder,
             EncoderSensor& right_encoder,
             float max_wheel_dps,
             uint32_t move_timeout_ms);

  void begin();

  void runContinuous(int16_t left_dps, int16_t right_dps) override;
  void runForAngle(Side side, int16_t speed_dps, int32_t degrees,
                   bool brake, bool wait) override;
  void stopAll() override;

  // Non-blocking: stop any wheel whose angle move is complete
  void service(uint32_t now_ms);

  bool moving() const;

  uint16_t timeouts() const { return _timeouts; }

private:
  struct AngleMove {
    bool active = false;
    float target_deg = 0.0f;   // magnitude
    bool brake = true;
    uint32_t started_ms = 0;
  };

  struct Wheel {
    DcMotorActuator& motor;
    EncoderSensor& encoder;
    AngleMove move;

    Wheel(DcMotorActuator& m, EncoderSensor& e) : motor(m), encoder(e) {}
  };

  Wheel& wheel_(Side side) { return (side == Side::LEFT) ? _left : _right; }

  float dpsToDuty_(int16_t dps) const;
  void serviceWheel_(Wheel& w, uint32_t now_ms);
  void waitForMoves_();

  Wheel _left;
  Wheel _right;

  float _max_wheel_dps;
  uint32_t _move_timeout_ms;

  uint16_t _timeouts = 0;
};
