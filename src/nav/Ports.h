#pragma once
#include <stdint.h>

#include "nav/Zone.h"

/*
===============================================================================
  Ports.h
===============================================================================

  PURPOSE
  -------
  The seams between the navigation core and the hardware.

  The firmware implements these on top of the Arduino drivers
  (SensorHub, DriveTrain, Indicator, SerialLink). Tests implement them
  with recording fakes so the whole run can be replayed without a robot.
===============================================================================
*/

class SensorPort {
public:
  virtual ~SensorPort() {}

  // Each returns false when the sensor has no usable reading this tick
  virtual bool readColor(Color& out) = 0;
  virtual bool readReflection(int& out_percent) = 0;
  virtual bool readDistanceMm(int& out_mm) = 0;
};

enum class Side : uint8_t {
  LEFT = 0,
  RIGHT,
};

class DrivePort {
public:
  virtual ~DrivePort() {}

  // Wheel speeds in deg/s, positive = forward. Runs until changed.
  virtual void runContinuous(int16_t left_dps, int16_t right_dps) = 0;

  /*
    Rotate one wheel by |degrees|. Direction is sign(speed) * sign(degrees).

    brake: hold position at the end instead of coasting
    wait : block until every pending angle move has finished
  */
  virtual void runForAngle(Side side, int16_t speed_dps, int32_t degrees,
                           bool brake, bool wait) = 0;

  virtual void stopAll() = 0;
};

// Buzzer + light used for audible/visual cues
class CuePort {
public:
  virtual ~CuePort() {}

  // Must not block for the tone duration
  virtual void beep(uint16_t freq_hz, uint16_t duration_ms) = 0;
  virtual void setLight(bool on) = 0;
};

// Line-oriented text output (one call = one line, no trailing newline)
class StatusSink {
public:
  virtual ~StatusSink() {}
  virtual void writeLine(const char* line) = 0;
};

class Clock {
public:
  virtual ~Clock() {}
  virtual uint32_t nowMs() = 0;
  virtual void sleepMs(uint32_t ms) = 0;
};
