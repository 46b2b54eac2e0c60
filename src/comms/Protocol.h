#pragma once
#include <stddef.h>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the robot <-> bridge wire protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
    - STATUS:/DEBUG lines share the port as plain text; the bridge tells
      them apart by the first character

  Buffers are plain char arrays so the same code runs on the Mega and in
  host tests.
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Robot -> Bridge)
=============================================================================*/

/*
  Writes one telemetry JSON line (with trailing '\n') into out.

  Returns:
    - number of chars written (excluding the terminating '\0')
    - 0 if out is too small for the whole line
*/
size_t encodeTelemetryLine(const TelemetryFrame& t, char* out, size_t out_size);

// Same contract for one calibration readout line.
size_t encodeCalibrationLine(const CalibrationFrame& c, char* out, size_t out_size);


/*=============================================================================
  DECODE (Bridge -> Robot)
=============================================================================*/

/*
  Attempts to parse one command JSON line.

  Returns:
    - true if decoded into out_cmd (and out_cmd.valid will be true)
    - false if not a valid command frame or parse failed
*/
bool decodeCommandLine(const char* line, CommandFrame& out_cmd);

}  // namespace protocol
