#pragma once
#include <stdint.h>

#include "comms/Messages.h"

/*
  CommandQueue

  Small FIFO of decoded command frames between SerialLink (filled while
  reading) and main.cpp (drained once per RX tick). Frames come out in the
  order they arrived, so a cancel followed by a run in the same RX pass
  are both handled: the cancel latches, then the run is answered.

  When full, the incoming frame is dropped and counted.
*/
class CommandQueue {
public:
  static constexpr uint8_t CAPACITY = 4;

  bool push(const CommandFrame& frame) {
    if (_count >= CAPACITY) {
      _dropped++;
      return false;
    }
    _frames[(uint8_t)((_head + _count) % CAPACITY)] = frame;
    _count++;
    return true;
  }

  // Oldest frame first. Returns false when empty.
  bool pop(CommandFrame& out) {
    if (_count == 0) return false;
    out = _frames[_head];
    _head = (uint8_t)((_head + 1) % CAPACITY);
    _count--;
    return true;
  }

  void clear() {
    _head = 0;
    _count = 0;
  }

  uint8_t size() const { return _count; }
  bool empty() const { return _count == 0; }

  uint32_t dropped() const { return _dropped; }

private:
  CommandFrame _frames[CAPACITY];
  uint8_t _head = 0;
  uint8_t _count = 0;
  uint32_t _dropped = 0;
};
