#pragma once
#include <Arduino.h>

#include "Params.h"
#include "comms/CommandQueue.h"
#include "comms/Messages.h"
#include "nav/Ports.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Robot-side serial link handler:

    - Non-blocking read from Stream
    - Accumulate bytes into a newline-delimited line buffer
    - Decode command frames and queue them in arrival order for main.cpp
    - Write STATUS:/DEBUG lines (StatusSink), telemetry and calibration frames

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

  Commands are queued (CommandQueue::CAPACITY deep). main.cpp drains the
  queue every RX tick, so a cancel and a run read in one pass are both
  applied, in order.
===============================================================================
*/

class SerialLink : public StatusSink {
public:
  explicit SerialLink(Stream& serial);

  void begin();

  // Call frequently. Reads any available bytes and decodes complete lines.
  // Never blocks waiting for input.
  void tick(uint32_t now_ms);

  // Pops the oldest unread command. Returns false if there is none.
  bool takeCommand(CommandFrame& out);

  // StatusSink
  void writeLine(const char* line) override;

  // Encodes and writes one telemetry line to the serial stream.
  void sendTelemetry(const TelemetryFrame& t);

  // Encodes and writes one calibration readout line.
  void sendCalibration(const CalibrationFrame& c);

  // ACK = last command seq that was received + parsed successfully
  uint32_t ackSeq() const { return _ack_seq; }

  // Short RX debug note (valid until _note_until_ms)
  const char* debugNote(uint32_t now_ms) const {
    return (now_ms <= _note_until_ms) ? _note_buf : nullptr;
  }

  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }
  uint32_t rxDropped() const { return _commands.dropped(); }

  // Snapshot of the RX counters for telemetry
  LinkStats stats() const;

private:
  void handleLine_(uint32_t now_ms);
  void note_(uint32_t now_ms, const char* fmt, ...);

  Stream& _serial;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  CommandQueue _commands;

  uint32_t _ack_seq = 0;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;

  char _note_buf[64];
  uint32_t _note_until_ms = 0;

  char _tx_buf[TELEMETRY_LINE_BYTES];
};
