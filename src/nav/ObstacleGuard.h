#pragma once
#include <stdint.h>

/*
  ObstacleGuard

  Forward-distance safety check. check() is true (unsafe) only when a
  reading exists and is at or inside the stop distance. A missing reading
  never stops the robot.
*/
class ObstacleGuard {
public:
  explicit ObstacleGuard(uint16_t stop_distance_mm = 0)
  : _stop_distance_mm(stop_distance_mm) {}

  bool check(bool distance_valid, int distance_mm) const {
    if (!distance_valid) return false;
    return distance_mm <= (int)_stop_distance_mm;
  }

  void setStopDistanceMm(uint16_t mm) { _stop_distance_mm = mm; }
  uint16_t stopDistanceMm() const { return _stop_distance_mm; }

private:
  uint16_t _stop_distance_mm;
};
