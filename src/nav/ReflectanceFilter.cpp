#include "nav/ReflectanceFilter.h"

constexpr uint8_t ReflectanceFilter::SIZE;

void ReflectanceFilter::reset() {
  for (uint8_t i = 0; i < SIZE; i++) _slots[i] = 0;
  _head = 0;
  _sum = 0;
  _primed = false;
}

void ReflectanceFilter::prefill(int raw) {
  for (uint8_t i = 0; i < SIZE; i++) _slots[i] = raw;
  _head = 0;
  _sum = (int32_t)raw * SIZE;
  _primed = true;
}

float ReflectanceFilter::push(int raw) {
  if (!_primed) {
    prefill(raw);
    return mean();
  }

  // Running sum stays exact because all values are integers
  _sum -= _slots[_head];
  _slots[_head] = raw;
  _sum += raw;

  _head = (uint8_t)((_head + 1) % SIZE);
  return mean();
}

float ReflectanceFilter::mean() const {
  if (!_primed) return 0.0f;
  return (float)_sum / (float)SIZE;
}

int ReflectanceFilter::at(uint8_t i) const {
  if (!_primed || i >= SIZE) return 0;
  return _slots[(_head + i) % SIZE];
}
