#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Wire format:
    - One JSON object per line
    - Bridge -> Robot: type="run" | type="cancel" | type="calibrate"
    - Robot -> Bridge: type="telemetry" | type="calibration"

  Notes:
  - Both directions use ArduinoJson with fixed-size documents; nothing is
    heap allocated.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Convert type string -> enum
static CommandType parseType(const char* s) {
  if (!s) return CommandType::UNKNOWN;
  if (strcmp(s, "run") == 0)    return CommandType::RUN;
  if (strcmp(s, "cancel") == 0) return CommandType::CANCEL;
  if (strcmp(s, "calibrate") == 0) return CommandType::CALIBRATE;
  return CommandType::UNKNOWN;
}

// Document capacities (slots only; every string is a literal or copied out)
static constexpr size_t TELEMETRY_DOC_SIZE =
    JSON_OBJECT_SIZE(16) + JSON_OBJECT_SIZE(2) + JSON_OBJECT_SIZE(5);
static constexpr size_t CALIBRATION_DOC_SIZE =
    JSON_OBJECT_SIZE(7) + JSON_OBJECT_SIZE(4);

// Nullable string field
static void setText(JsonObject obj, const char* key, const char* value) {
  if (value)
    obj[key] = value;
  else
    obj[key] = nullptr;
}

// Nullable int field
static void setInt(JsonObject obj, const char* key, int value, bool valid) {
  if (valid)
    obj[key] = value;
  else
    obj[key] = nullptr;
}

// Whole line or nothing: a truncated JSON object is worse than a gap
static size_t writeLine(const JsonDocument& doc, char* out, size_t out_size) {
  if (doc.overflowed()) return 0;

  const size_t len = measureJson(doc);
  if (len + 2 > out_size) return 0;   // + '\n' + '\0'

  const size_t n = serializeJson(doc, out, out_size);
  out[n] = '\n';
  out[n + 1] = '\0';
  return n + 1;
}


namespace protocol {

/*=============================================================================
  ENCODE (Robot -> Bridge)
=============================================================================*/

size_t encodeTelemetryLine(const TelemetryFrame& t, char* out, size_t out_size) {
  if (!out || out_size == 0) return 0;
  out[0] = '\0';

  StaticJsonDocument<TELEMETRY_DOC_SIZE> doc;
  JsonObject root = doc.to<JsonObject>();

  root["type"] = "telemetry";
  root["arduino_time_ms"] = t.arduino_time_ms;
  root["ack_seq"] = t.ack_seq;
  root["active"] = t.run_active;

  setText(root, "phase", t.phase);
  setText(root, "target", t.target);
  setText(root, "zone", t.zone);

  root["hits"] = t.hits;
  root["samples"] = t.samples;

  // reflectance
  JsonObject refl = root.createNestedObject("reflectance");
  if (t.reflectance.raw_valid)
    refl["raw"] = t.reflectance.raw;
  else
    refl["raw"] = nullptr;
  refl["smoothed"] = t.reflectance.smoothed;

  // ultrasonic
  setInt(root, "distance_mm", t.distance_mm, t.distance_valid);

  // link health
  JsonObject link = root.createNestedObject("link");
  link["lines"] = t.link.lines;
  link["ok"] = t.link.ok;
  link["fail"] = t.link.fail;
  link["ovf"] = t.link.ovf;
  link["dropped"] = t.link.dropped;

  root["drive_timeouts"] = t.drive_timeouts;

  setText(root, "note", t.note);

  return writeLine(doc, out, out_size);
}

size_t encodeCalibrationLine(const CalibrationFrame& c, char* out, size_t out_size) {
  if (!out || out_size == 0) return 0;
  out[0] = '\0';

  StaticJsonDocument<CALIBRATION_DOC_SIZE> doc;
  JsonObject root = doc.to<JsonObject>();

  root["type"] = "calibration";
  root["arduino_time_ms"] = c.arduino_time_ms;

  setInt(root, "reflectance", c.reflectance, c.reflectance_valid);
  setInt(root, "ambient", c.ambient, c.ambient_valid);
  setText(root, "color", c.color);

  JsonObject period = root.createNestedObject("period_us");
  period["r"] = c.r_us;
  period["g"] = c.g_us;
  period["b"] = c.b_us;
  period["clear"] = c.clear_us;

  setInt(root, "distance_mm", c.distance_mm, c.distance_valid);

  return writeLine(doc, out, out_size);
}


/*=============================================================================
  DECODE (Bridge -> Robot)
=============================================================================*/

bool decodeCommandLine(const char* line, CommandFrame& out_cmd) {
  out_cmd = CommandFrame();   // reset everything
  if (!line) return false;

  StaticJsonDocument<256> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  const CommandType type = parseType(obj["type"]);
  if (type == CommandType::UNKNOWN) return false;

  // Required fields
  if (!obj.containsKey("seq")) return false;
  if (!obj["seq"].is<uint32_t>()) return false;

  out_cmd.seq = obj["seq"].as<uint32_t>();
  out_cmd.type = type;

  if (type == CommandType::RUN) {
    const char* text = obj["command"];
    if (!text || text[0] == '\0') return false;

    strncpy(out_cmd.command, text, sizeof(out_cmd.command) - 1);
    out_cmd.command[sizeof(out_cmd.command) - 1] = '\0';
  }

  if (type == CommandType::CALIBRATE && obj.containsKey("enable")) {
    if (!obj["enable"].is<bool>()) return false;
    out_cmd.enable = obj["enable"].as<bool>();
  }

  out_cmd.valid = true;
  return true;
}

}  // namespace protocol
