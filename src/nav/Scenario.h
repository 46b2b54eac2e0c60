#pragma once
#include <stdint.h>
#include <stddef.h>

#include "nav/NavConfig.h"
#include "nav/Zone.h"

/*
===============================================================================
  Scenario.h
===============================================================================

  PURPOSE
  -------
  Maps an external command string to a scenario and its target zone.

  Command table (case-insensitive, surrounding whitespace ignored):
    RECYCLING_OK, OK, NORMAL                       -> RECYCLING_OK (first zone)
    CONTAMINATED, LANDFILL, ROUTE_TO_LANDFILL      -> CONTAMINATED (last zone)
    INSPECTION, URGENT_INSPECTION,
    URGENT_FIELD_INSPECTION, FIELD_INSPECTION      -> INSPECTION   (middle zone)

  Anything else is handled by NavConfig::unknown_policy.
  CONTAMINATED runs in hazard mode (turbo speed + siren).
===============================================================================
*/

enum class Scenario : uint8_t {
  NONE = 0,
  RECYCLING_OK,
  CONTAMINATED,
  INSPECTION,
};

struct TargetSelection {
  Scenario scenario = Scenario::NONE;
  uint8_t  target_slot = SLOT_FIRST;
  Color    target = Color::NONE;
  bool     hazard = false;
  bool     defaulted = false;     // command was unknown, default_slot used

  static constexpr size_t COMMAND_BUF_SIZE = 32;
  char command[COMMAND_BUF_SIZE] = {0};   // normalized command text
};

namespace scenario {

// Table lookup only. Returns false for unknown commands.
bool fromCommand(const char* command, Scenario& out);

// Upper-case, whitespace-trimmed copy of command (truncated to out_size)
void normalize(const char* command, char* out, size_t out_size);

uint8_t targetSlot(Scenario s);
Scenario forSlot(uint8_t slot);

const char* name(Scenario s);

bool isHazard(Scenario s);

/*
  Full selection for one run.

  Returns false when the command is unknown and the policy is REJECT.
  out.command always holds the normalized command, even on failure.
*/
bool select(const char* command, const NavConfig& cfg, TargetSelection& out);

}  // namespace scenario
