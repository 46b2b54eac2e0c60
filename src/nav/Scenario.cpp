#include "nav/Scenario.h"

#include <ctype.h>
#include <string.h>

/*=============================================================================
  COMMAND TABLE
=============================================================================*/

namespace {

struct CommandEntry {
  const char* command;
  Scenario scenario;
};

const CommandEntry COMMAND_TABLE[] = {
  {"RECYCLING_OK",            Scenario::RECYCLING_OK},
  {"OK",                      Scenario::RECYCLING_OK},
  {"NORMAL",                  Scenario::RECYCLING_OK},

  {"CONTAMINATED",            Scenario::CONTAMINATED},
  {"LANDFILL",                Scenario::CONTAMINATED},
  {"ROUTE_TO_LANDFILL",       Scenario::CONTAMINATED},

  {"INSPECTION",              Scenario::INSPECTION},
  {"URGENT_INSPECTION",       Scenario::INSPECTION},
  {"URGENT_FIELD_INSPECTION", Scenario::INSPECTION},
  {"FIELD_INSPECTION",        Scenario::INSPECTION},
};

const size_t COMMAND_TABLE_LEN = sizeof(COMMAND_TABLE) / sizeof(COMMAND_TABLE[0]);

}  // namespace


namespace scenario {

void normalize(const char* command, char* out, size_t out_size) {
  if (!out || out_size == 0) return;
  out[0] = '\0';
  if (!command) return;

  // Skip leading whitespace
  while (*command && isspace((unsigned char)*command)) command++;

  size_t n = 0;
  while (command[n] && n + 1 < out_size) {
    out[n] = (char)toupper((unsigned char)command[n]);
    n++;
  }
  out[n] = '\0';

  // Strip trailing whitespace
  while (n > 0 && isspace((unsigned char)out[n - 1])) {
    out[--n] = '\0';
  }
}

bool fromCommand(const char* command, Scenario& out) {
  out = Scenario::NONE;

  char buf[TargetSelection::COMMAND_BUF_SIZE];
  normalize(command, buf, sizeof(buf));
  if (buf[0] == '\0') return false;

  for (size_t i = 0; i < COMMAND_TABLE_LEN; i++) {
    if (strcmp(buf, COMMAND_TABLE[i].command) == 0) {
      out = COMMAND_TABLE[i].scenario;
      return true;
    }
  }
  return false;
}

uint8_t targetSlot(Scenario s) {
  switch (s) {
    case Scenario::CONTAMINATED: return SLOT_LAST;
    case Scenario::INSPECTION:   return SLOT_MIDDLE;
    case Scenario::RECYCLING_OK:
    case Scenario::NONE:
    default:
      return SLOT_FIRST;
  }
}

Scenario forSlot(uint8_t slot) {
  switch (slot) {
    case SLOT_MIDDLE: return Scenario::INSPECTION;
    case SLOT_LAST:   return Scenario::CONTAMINATED;
    case SLOT_FIRST:
    default:
      return Scenario::RECYCLING_OK;
  }
}

const char* name(Scenario s) {
  switch (s) {
    case Scenario::RECYCLING_OK: return "RECYCLING_OK";
    case Scenario::CONTAMINATED: return "CONTAMINATED";
    case Scenario::INSPECTION:   return "INSPECTION";
    case Scenario::NONE:
    default:
      return "NONE";
  }
}

bool isHazard(Scenario s) {
  return s == Scenario::CONTAMINATED;
}

bool select(const char* command, const NavConfig& cfg, TargetSelection& out) {
  out = TargetSelection();
  normalize(command, out.command, sizeof(out.command));

  Scenario s;
  if (!fromCommand(out.command, s)) {
    if (cfg.unknown_policy != UnknownCommandPolicy::DEFAULT_ZONE) {
      return false;
    }
    s = forSlot(cfg.default_slot);
    out.defaulted = true;
  }

  out.scenario = s;
  out.target_slot = targetSlot(s);
  out.target = cfg.classifier.board.at(out.target_slot);
  out.hazard = isHazard(s);
  return out.target != Color::NONE;
}

}  // namespace scenario
