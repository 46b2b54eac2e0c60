#pragma once
#include <stdint.h>

/*
===============================================================================
  Zone.h
===============================================================================

  PURPOSE
  -------
  Color vocabulary shared by the color sensor and the board model.

  A "zone" is one of the three colored regions on the board. The board
  layout lists them in physical order (Edge1 -> Middle -> Edge2), and
  that order is what the wrong-way logic reasons about.

  Slot convention:
    0 = first zone  (Edge1)
    1 = middle zone
    2 = last zone   (Edge2)
===============================================================================
*/

enum class Color : uint8_t {
  NONE = 0,
  BLACK,
  WHITE,
  RED,
  GREEN,
  BLUE,
  YELLOW,
};

constexpr uint8_t ZONE_COUNT = 3;

constexpr uint8_t SLOT_FIRST  = 0;
constexpr uint8_t SLOT_MIDDLE = 1;
constexpr uint8_t SLOT_LAST   = 2;

// Returned by BoardLayout::slotOf() when a color is not on the board
constexpr int8_t SLOT_NONE = -1;

struct BoardLayout {
  Color order[ZONE_COUNT] = {Color::NONE, Color::NONE, Color::NONE};

  int8_t slotOf(Color c) const;
  bool contains(Color c) const { return slotOf(c) != SLOT_NONE; }

  Color at(uint8_t slot) const {
    return (slot < ZONE_COUNT) ? order[slot] : Color::NONE;
  }
};

namespace zones {

// GREEN -> YELLOW -> RED
BoardLayout standardBoard();

// GREEN -> BLUE -> RED
BoardLayout blueMiddleBoard();

// Upper-case name used in status tokens ("GREEN", "RED", ...)
const char* colorName(Color c);

// Bit for a slot inside a visited mask
inline uint8_t slotBit(uint8_t slot) { return (uint8_t)(1u << slot); }

}  // namespace zones
