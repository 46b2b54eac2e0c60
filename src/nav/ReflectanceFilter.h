#pragma once
#include <stdint.h>

/*
===============================================================================
  ReflectanceFilter.h
===============================================================================

  PURPOSE
  -------
  Fixed 5-slot moving average over raw reflectance readings.

  Rules:
    - prefill(raw) fills every slot with the first real reading, so the
      average starts at that value instead of being dragged toward 0
    - push(raw) evicts the oldest slot and returns the new mean
    - once primed, size() is always SIZE

  A push() before prefill() primes the buffer with that value first.
===============================================================================
*/

class ReflectanceFilter {
public:
  static constexpr uint8_t SIZE = 5;

  ReflectanceFilter() { reset(); }

  // Back to the unprimed state (start of a run)
  void reset();

  void prefill(int raw);

  // Insert newest, evict oldest, return the mean of the buffer
  float push(int raw);

  float mean() const;

  bool primed() const { return _primed; }
  uint8_t size() const { return _primed ? SIZE : 0; }

  // i = 0 is the oldest value
  int at(uint8_t i) const;

private:
  int _slots[SIZE];
  uint8_t _head = 0;     // index of the oldest slot
  int32_t _sum = 0;
  bool _primed = false;
};
