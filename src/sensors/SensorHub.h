#pragma once
#include <Arduino.h>

#include "nav/Ports.h"
#include "sensors/ColorSensor.h"
#include "sensors/DistanceSensor.h"

/*
  SensorHub

  SensorPort for the real robot: the down-facing TCS3200 and the forward
  HC-SR04. Reads happen when the navigator asks for them, once per tick.
*/
class SensorHub : public SensorPort {
public:
  SensorHub(ColorSensor& color, DistanceSensor& distance)
  : _color(color), _distance(distance) {}

  bool readColor(Color& out) override { return _color.readColor(out); }

  bool readReflection(int& out_percent) override { return _color.readReflection(out_percent); }

  bool readDistanceMm(int& out_mm) override { return _distance.measure(millis(), out_mm); }

private:
  ColorSensor& _color;
  DistanceSensor& _distance;
};
