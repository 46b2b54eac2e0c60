#include "comms/SerialLink.h"

#include <string.h>
#include <stdarg.h>

#include "comms/Protocol.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - Lines that do not start with '{' are not commands and are ignored
===============================================================================
*/

SerialLink::SerialLink(Stream& serial)
: _serial(serial)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
  memset(_tx_buf, 0, sizeof(_tx_buf));
}

void SerialLink::begin() {
  _rx_len = 0;
  _dropping = false;

  _commands.clear();
  _ack_seq = 0;

  _lines = _ok = _fail = _ovf = 0;

  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
  _note_until_ms = 0;
  note_(0, "BOOT RX_BUF_SIZE=%u", (unsigned)RX_BUF_SIZE);
}

bool SerialLink::takeCommand(CommandFrame& out) {
  return _commands.pop(out);
}

LinkStats SerialLink::stats() const {
  LinkStats s;
  s.lines = _lines;
  s.ok = _ok;
  s.fail = _fail;
  s.ovf = _ovf;
  s.dropped = _commands.dropped();
  return s;
}

void SerialLink::writeLine(const char* line) {
  _serial.println(line);
}

void SerialLink::sendTelemetry(const TelemetryFrame& t) {
  const size_t n = protocol::encodeTelemetryLine(t, _tx_buf, sizeof(_tx_buf));
  if (n == 0) {
    note_(millis(), "TX DROP telemetry too large");
    return;
  }
  _serial.write((const uint8_t*)_tx_buf, n);
}

void SerialLink::sendCalibration(const CalibrationFrame& c) {
  const size_t n = protocol::encodeCalibrationLine(c, _tx_buf, sizeof(_tx_buf));
  if (n == 0) {
    note_(millis(), "TX DROP calibration too large");
    return;
  }
  _serial.write((const uint8_t*)_tx_buf, n);
}

void SerialLink::note_(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_until_ms = now_ms + 1500;
}

void SerialLink::tick(uint32_t now_ms) {
  while (_serial.available() > 0) {
    int c = _serial.read();
    if (c < 0) break;

    char ch = (char)c;

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _rx_len = 0;
      }
      continue;
    }

    if (ch == '\n') {
      _rx_buf[_rx_len] = '\0';
      _lines++;

      handleLine_(now_ms);

      _rx_len = 0;
      continue;
    }

    // Append to buffer if there is room (leave space for '\0')
    if (_rx_len + 1 < RX_BUF_SIZE) {
      _rx_buf[_rx_len++] = ch;
    } else {
      _ovf++;
      _dropping = true;

      _rx_buf[RX_BUF_SIZE - 1] = '\0';
      note_(now_ms, "RX OVF ovf=%lu head=%.24s", (unsigned long)_ovf, _rx_buf);

      _rx_len = 0;
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  if (_rx_buf[0] != '{') return;

  CommandFrame cmd;
  if (protocol::decodeCommandLine(_rx_buf, cmd) && cmd.valid) {
    _ack_seq = cmd.seq;
    _ok++;

    if (_commands.push(cmd)) {
      note_(now_ms, "RX OK seq=%lu", (unsigned long)cmd.seq);
    } else {
      note_(now_ms, "RX DROP queue full seq=%lu", (unsigned long)cmd.seq);
    }
  } else {
    _fail++;

    note_(now_ms,
          "RX FAIL fail=%lu len=%u head=%.24s",
          (unsigned long)_fail,
          (unsigned)_rx_len,
          _rx_buf);
  }
}
