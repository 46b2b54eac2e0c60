#include <gtest/gtest.h>

#include <ArduinoJson.h>
#include <string.h>
#include <string>

#include "comms/Protocol.h"

TEST(DecodeCommand, RunFrame) {
  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(R"({"type":"run","seq":7,"command":"landfill"})", cmd));
  EXPECT_TRUE(cmd.valid);
  EXPECT_EQ(cmd.type, CommandType::RUN);
  EXPECT_EQ(cmd.seq, 7u);
  EXPECT_STREQ(cmd.command, "landfill");
}

TEST(DecodeCommand, CancelFrameNeedsNoCommand) {
  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(R"({"type":"cancel","seq":8})", cmd));
  EXPECT_EQ(cmd.type, CommandType::CANCEL);
  EXPECT_EQ(cmd.seq, 8u);
  EXPECT_STREQ(cmd.command, "");
}

TEST(DecodeCommand, RejectsBadFrames) {
  const char* bad[] = {
    "",
    "not json",
    "[1,2,3]",
    R"({"type":"run","command":"OK"})",                  // no seq
    R"({"type":"run","seq":-1,"command":"OK"})",          // negative seq
    R"({"type":"run","seq":"3","command":"OK"})",         // seq as text
    R"({"type":"run","seq":3})",                          // no command
    R"({"type":"run","seq":3,"command":""})",             // empty command
    R"({"type":"teleop","seq":3,"command":"OK"})",        // unknown type
    R"({"seq":3,"command":"OK"})",                        // no type
  };

  for (const char* line : bad) {
    CommandFrame cmd;
    EXPECT_FALSE(protocol::decodeCommandLine(line, cmd)) << line;
    EXPECT_FALSE(cmd.valid) << line;
  }

  CommandFrame cmd;
  EXPECT_FALSE(protocol::decodeCommandLine(nullptr, cmd));
}

TEST(DecodeCommand, LongCommandIsTruncated) {
  const std::string text(60, 'A');
  const std::string line = std::string(R"({"type":"run","seq":1,"command":")") + text + "\"}";

  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(line.c_str(), cmd));
  EXPECT_EQ(strlen(cmd.command), CommandFrame::COMMAND_TEXT_SIZE - 1);
}

TEST(EncodeTelemetry, FullFrame) {
  TelemetryFrame t;
  t.arduino_time_ms = 12345;
  t.ack_seq = 7;
  t.run_active = true;
  t.phase = "SEARCHING";
  t.target = "RED";
  t.zone = "YELLOW";
  t.hits = 2;
  t.samples = 14;
  t.reflectance.raw = 16;
  t.reflectance.raw_valid = true;
  t.reflectance.smoothed = 15.5f;
  t.distance_mm = 420;
  t.distance_valid = true;

  char buf[512];
  const size_t n = protocol::encodeTelemetryLine(t, buf, sizeof(buf));
  ASSERT_GT(n, 0u);
  EXPECT_EQ(n, strlen(buf));
  EXPECT_EQ(buf[n - 1], '\n');

  StaticJsonDocument<2048> doc;
  ASSERT_FALSE(deserializeJson(doc, buf));

  EXPECT_STREQ(doc["type"].as<const char*>(), "telemetry");
  EXPECT_EQ(doc["arduino_time_ms"].as<uint32_t>(), 12345u);
  EXPECT_EQ(doc["ack_seq"].as<uint32_t>(), 7u);
  EXPECT_TRUE(doc["active"].as<bool>());
  EXPECT_STREQ(doc["phase"].as<const char*>(), "SEARCHING");
  EXPECT_STREQ(doc["target"].as<const char*>(), "RED");
  EXPECT_STREQ(doc["zone"].as<const char*>(), "YELLOW");
  EXPECT_EQ(doc["hits"].as<int>(), 2);
  EXPECT_EQ(doc["samples"].as<int>(), 14);
  EXPECT_EQ(doc["reflectance"]["raw"].as<int>(), 16);
  EXPECT_FLOAT_EQ(doc["reflectance"]["smoothed"].as<float>(), 15.5f);
  EXPECT_EQ(doc["distance_mm"].as<int>(), 420);
  EXPECT_TRUE(doc["note"].isNull());
}

TEST(EncodeTelemetry, CarriesLinkCountersAndDriveTimeouts) {
  TelemetryFrame t;
  t.phase = "IDLE";
  t.link.lines = 40;
  t.link.ok = 37;
  t.link.fail = 2;
  t.link.ovf = 1;
  t.link.dropped = 3;
  t.drive_timeouts = 5;

  char buf[512];
  ASSERT_GT(protocol::encodeTelemetryLine(t, buf, sizeof(buf)), 0u);

  StaticJsonDocument<2048> doc;
  ASSERT_FALSE(deserializeJson(doc, buf));

  EXPECT_EQ(doc["link"]["lines"].as<uint32_t>(), 40u);
  EXPECT_EQ(doc["link"]["ok"].as<uint32_t>(), 37u);
  EXPECT_EQ(doc["link"]["fail"].as<uint32_t>(), 2u);
  EXPECT_EQ(doc["link"]["ovf"].as<uint32_t>(), 1u);
  EXPECT_EQ(doc["link"]["dropped"].as<uint32_t>(), 3u);
  EXPECT_EQ(doc["drive_timeouts"].as<int>(), 5);
}

TEST(EncodeTelemetry, WorstCaseFrameFitsLineBuffer) {
  TelemetryFrame t;
  t.arduino_time_ms = 4294967295u;
  t.ack_seq = 4294967295u;
  t.run_active = true;
  t.phase = "FINAL_PUSH";
  t.target = "YELLOW";
  t.zone = "YELLOW";
  t.hits = 255;
  t.samples = 65535;
  t.reflectance.raw = -2147483647;
  t.reflectance.raw_valid = true;
  t.reflectance.smoothed = -12345.678f;
  t.distance_mm = -2147483647;
  t.distance_valid = true;
  t.link.lines = t.link.ok = t.link.fail = t.link.ovf = t.link.dropped = 4294967295u;
  t.drive_timeouts = 65535;
  t.note = "RX FAIL fail=4294967295 len=159 head=012345678901234567890123";

  char buf[512];
  EXPECT_GT(protocol::encodeTelemetryLine(t, buf, sizeof(buf)), 0u);
}

TEST(EncodeTelemetry, MissingValuesAreNull) {
  TelemetryFrame t;

  char buf[512];
  ASSERT_GT(protocol::encodeTelemetryLine(t, buf, sizeof(buf)), 0u);

  StaticJsonDocument<2048> doc;
  ASSERT_FALSE(deserializeJson(doc, buf));

  EXPECT_TRUE(doc.containsKey("phase"));
  EXPECT_TRUE(doc["phase"].isNull());
  EXPECT_TRUE(doc["target"].isNull());
  EXPECT_TRUE(doc["zone"].isNull());
  EXPECT_TRUE(doc["reflectance"]["raw"].isNull());
  EXPECT_TRUE(doc["distance_mm"].isNull());
  EXPECT_FALSE(doc["active"].as<bool>());
}

TEST(EncodeTelemetry, TooSmallBufferWritesNothing) {
  TelemetryFrame t;
  t.phase = "SEARCHING";

  char buf[32];
  EXPECT_EQ(protocol::encodeTelemetryLine(t, buf, sizeof(buf)), 0u);
  EXPECT_STREQ(buf, "");

  EXPECT_EQ(protocol::encodeTelemetryLine(t, nullptr, 0), 0u);
}

TEST(DecodeCommand, CalibrateEnablesByDefault) {
  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(R"({"type":"calibrate","seq":9})", cmd));
  EXPECT_EQ(cmd.type, CommandType::CALIBRATE);
  EXPECT_EQ(cmd.seq, 9u);
  EXPECT_TRUE(cmd.enable);
}

TEST(DecodeCommand, CalibrateCanBeSwitchedOff) {
  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(R"({"type":"calibrate","seq":10,"enable":false})", cmd));
  EXPECT_EQ(cmd.type, CommandType::CALIBRATE);
  EXPECT_FALSE(cmd.enable);

  ASSERT_TRUE(protocol::decodeCommandLine(R"({"type":"calibrate","seq":11,"enable":true})", cmd));
  EXPECT_TRUE(cmd.enable);
}

TEST(DecodeCommand, CalibrateEnableMustBeBool) {
  CommandFrame cmd;
  EXPECT_FALSE(protocol::decodeCommandLine(R"({"type":"calibrate","seq":12,"enable":"no"})", cmd));
  EXPECT_FALSE(protocol::decodeCommandLine(R"({"type":"calibrate","seq":12,"enable":0})", cmd));
  EXPECT_FALSE(protocol::decodeCommandLine(R"({"type":"calibrate","enable":true})", cmd));
  EXPECT_FALSE(cmd.valid);
}

TEST(EncodeCalibration, RawReadings) {
  CalibrationFrame c;
  c.arduino_time_ms = 800;
  c.reflectance = 13;
  c.reflectance_valid = true;
  c.ambient = 2;
  c.ambient_valid = true;
  c.color = "GREEN";
  c.r_us = 410;
  c.g_us = 150;
  c.b_us = 300;
  c.clear_us = 90;
  c.distance_mm = 610;
  c.distance_valid = true;

  char buf[512];
  const size_t n = protocol::encodeCalibrationLine(c, buf, sizeof(buf));
  ASSERT_GT(n, 0u);
  EXPECT_EQ(buf[n - 1], '\n');

  StaticJsonDocument<2048> doc;
  ASSERT_FALSE(deserializeJson(doc, buf));

  EXPECT_STREQ(doc["type"].as<const char*>(), "calibration");
  EXPECT_EQ(doc["arduino_time_ms"].as<uint32_t>(), 800u);
  EXPECT_EQ(doc["reflectance"].as<int>(), 13);
  EXPECT_EQ(doc["ambient"].as<int>(), 2);
  EXPECT_STREQ(doc["color"].as<const char*>(), "GREEN");
  EXPECT_EQ(doc["period_us"]["r"].as<uint32_t>(), 410u);
  EXPECT_EQ(doc["period_us"]["g"].as<uint32_t>(), 150u);
  EXPECT_EQ(doc["period_us"]["b"].as<uint32_t>(), 300u);
  EXPECT_EQ(doc["period_us"]["clear"].as<uint32_t>(), 90u);
  EXPECT_EQ(doc["distance_mm"].as<int>(), 610);
}

TEST(EncodeCalibration, MissingReadingsAreNull) {
  CalibrationFrame c;

  char buf[512];
  ASSERT_GT(protocol::encodeCalibrationLine(c, buf, sizeof(buf)), 0u);

  StaticJsonDocument<2048> doc;
  ASSERT_FALSE(deserializeJson(doc, buf));

  EXPECT_TRUE(doc.containsKey("reflectance"));
  EXPECT_TRUE(doc["reflectance"].isNull());
  EXPECT_TRUE(doc["ambient"].isNull());
  EXPECT_TRUE(doc["color"].isNull());
  EXPECT_TRUE(doc["distance_mm"].isNull());
  EXPECT_EQ(doc["period_us"]["clear"].as<uint32_t>(), 0u);
}
