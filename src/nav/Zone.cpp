#include "nav/Zone.h"

int8_t BoardLayout::slotOf(Color c) const {
  if (c == Color::NONE) return SLOT_NONE;

  for (uint8_t i = 0; i < ZONE_COUNT; i++) {
    if (order[i] == c) return (int8_t)i;
  }
  return SLOT_NONE;
}

namespace zones {

BoardLayout standardBoard() {
  BoardLayout b;
  b.order[SLOT_FIRST]  = Color::GREEN;
  b.order[SLOT_MIDDLE] = Color::YELLOW;
  b.order[SLOT_LAST]   = Color::RED;
  return b;
}

BoardLayout blueMiddleBoard() {
  BoardLayout b;
  b.order[SLOT_FIRST]  = Color::GREEN;
  b.order[SLOT_MIDDLE] = Color::BLUE;
  b.order[SLOT_LAST]   = Color::RED;
  return b;
}

const char* colorName(Color c) {
  switch (c) {
    case Color::BLACK:  return "BLACK";
    case Color::WHITE:  return "WHITE";
    case Color::RED:    return "RED";
    case Color::GREEN:  return "GREEN";
    case Color::BLUE:   return "BLUE";
    case Color::YELLOW: return "YELLOW";
    case Color::NONE:
    default:
      return "NONE";
  }
}

}  // namespace zones
