#pragma once
#include <stdint.h>
#include <stddef.h>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines command and telemetry data structures exchanged between the
  robot and the bridge over newline-delimited JSON.

  Notes:
  - Optional fields carry a valid flag (or nullptr) and are encoded as
    JSON null.
  - STATUS: lines are plain text and are not part of this schema.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Bridge -> Robot)
=============================================================================*/

enum class CommandType : uint8_t {
  UNKNOWN = 0,
  RUN,       // {"type":"run","seq":<u32>,"command":"<scenario command>"}
  CANCEL,    // {"type":"cancel","seq":<u32>}
  CALIBRATE, // {"type":"calibrate","seq":<u32>,"enable":<bool, default true>}
};

struct CommandFrame {
  uint32_t seq = 0;
  CommandType type = CommandType::UNKNOWN;

  static constexpr size_t COMMAND_TEXT_SIZE = 32;
  char command[COMMAND_TEXT_SIZE] = {0};   // RUN only; truncated if longer

  bool enable = true;  // CALIBRATE only

  bool valid = false;  // set true after successful decode
};


/*=============================================================================
  TELEMETRY STRUCTURES (Robot -> Bridge)
=============================================================================*/

// {"raw": <int>|null, "smoothed": <float>}
struct ReflectanceState {
  int   raw = 0;
  bool  raw_valid = false;
  float smoothed = 0.0f;
};

// RX counters of the serial link
struct LinkStats {
  uint32_t lines = 0;
  uint32_t ok = 0;
  uint32_t fail = 0;
  uint32_t ovf = 0;
  uint32_t dropped = 0;   // decoded but the command queue was full
};

// Full telemetry frame
struct TelemetryFrame {
  uint32_t arduino_time_ms = 0;
  uint32_t ack_seq = 0;

  bool        run_active = false;
  const char* phase = nullptr;      // "SEARCHING", ...
  const char* target = nullptr;     // "RED", ... or null when idle
  const char* zone = nullptr;       // last classification or null

  uint8_t  hits = 0;
  uint16_t samples = 0;

  ReflectanceState reflectance;

  int  distance_mm = 0;
  bool distance_valid = false;

  LinkStats link;
  uint16_t  drive_timeouts = 0;

  const char* note = nullptr;  // optional debug string
};

// Raw sensor readout sent while calibration mode is on
struct CalibrationFrame {
  uint32_t arduino_time_ms = 0;

  int  reflectance = 0;          // percent, LED on
  bool reflectance_valid = false;
  int  ambient = 0;              // percent, LED off
  bool ambient_valid = false;

  const char* color = nullptr;   // TCS3200 classification or null

  // TCS3200 output periods per filter (0 = timed out)
  uint32_t r_us = 0;
  uint32_t g_us = 0;
  uint32_t b_us = 0;
  uint32_t clear_us = 0;

  int  distance_mm = 0;
  bool distance_valid = false;
};
