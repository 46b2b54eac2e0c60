#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "FakePorts.h"
#include "TestConfig.h"
#include "nav/RunController.h"

namespace {

class RunControllerTest : public ::testing::Test {
protected:
  RunControllerTest()
  : runner(testConfig(), sensors, drive, cue, sink, clock)
  {
  }

  void tickUntilIdle(int max_ticks = 200) {
    for (int i = 0; i < max_ticks && runner.active(); i++) {
      runner.tick();
      clock.now += runner.config().sample_period_ms;
    }
  }

  ScriptedSensors sensors;
  RecordingDrive drive;
  RecordingCue cue;
  RecordingSink sink;
  FakeClock clock;
  RunController runner;
};

}  // namespace


TEST_F(RunControllerTest, StartSettlesSensorBeforeFirstSample) {
  ASSERT_TRUE(runner.start("OK"));
  EXPECT_TRUE(runner.active());
  EXPECT_EQ(clock.slept, 500u);
  EXPECT_TRUE(cue.light);
  EXPECT_EQ(runner.runsStarted(), 1);
}

TEST_F(RunControllerTest, UnknownCommandIsRejected) {
  EXPECT_FALSE(runner.start("compost"));
  EXPECT_FALSE(runner.active());
  EXPECT_EQ(runner.runsRejected(), 1);
  EXPECT_EQ(clock.slept, 0u);

  const std::vector<std::string> expected = {"REJECTED command=COMPOST"};
  EXPECT_EQ(sink.tokens(), expected);
}

TEST_F(RunControllerTest, UnknownCommandCanDefault) {
  NavConfig cfg = testConfig();
  cfg.unknown_policy = UnknownCommandPolicy::DEFAULT_ZONE;
  cfg.default_slot = SLOT_LAST;
  RunController runner2(cfg, sensors, drive, cue, sink, clock);

  ASSERT_TRUE(runner2.start("compost"));
  EXPECT_EQ(runner2.navigator().selection().target, Color::RED);
  EXPECT_EQ(sink.countToken("START scenario=CONTAMINATED"), 1u);
}

TEST_F(RunControllerTest, SecondCommandWhileBusyIsRejected) {
  sensors.push(colorReading(Color::RED));
  ASSERT_TRUE(runner.start("OK"));
  runner.tick();
  ASSERT_TRUE(runner.active());

  EXPECT_FALSE(runner.start("landfill"));
  EXPECT_EQ(sink.countToken("REJECTED command=LANDFILL"), 1u);
  EXPECT_EQ(runner.navigator().selection().target, Color::GREEN);
}

TEST_F(RunControllerTest, AlreadyOnTargetMakesNoDriveCalls) {
  sensors.push(colorReading(Color::GREEN));
  ASSERT_TRUE(runner.start("RECYCLING_OK"));
  runner.tick();

  EXPECT_FALSE(runner.active());
  EXPECT_TRUE(drive.calls.empty());
  EXPECT_EQ(cue.beepsAt(1500), 1u);
  EXPECT_EQ(sink.countToken("DONE"), 1u);
}

TEST_F(RunControllerTest, ContaminatedRunEndToEnd) {
  sensors.push(colorReading(Color::GREEN), 1 + 3);   // init + warmup
  sensors.push(colorReading(Color::GREEN), 2);
  sensors.push(colorReading(Color::YELLOW), 3);
  sensors.push(colorReading(Color::RED), 6);

  ASSERT_TRUE(runner.start("CONTAMINATED"));
  tickUntilIdle();
  EXPECT_FALSE(runner.active());

  const std::vector<std::string> tokens = sink.tokens();
  ASSERT_GE(tokens.size(), 3u);
  EXPECT_EQ(tokens.front(), "START scenario=CONTAMINATED");
  EXPECT_EQ(tokens[tokens.size() - 3], "RED_REACHED");
  EXPECT_EQ(tokens[tokens.size() - 2], "ZONE=CONTAMINATED");
  EXPECT_EQ(tokens.back(), "DONE");

  // Drive off at turbo speed
  ASSERT_FALSE(drive.calls.empty());
  EXPECT_EQ(drive.calls[0].kind, DriveCall::CONTINUOUS);
  EXPECT_EQ(drive.calls[0].left_dps, 500);
  EXPECT_EQ(drive.calls[0].right_dps, 500);

  // Final push: both wheels the same way, right one waits, then stop
  const size_t n = drive.calls.size();
  ASSERT_GE(n, 4u);
  EXPECT_EQ(drive.calls[n - 3].kind, DriveCall::ANGLE);
  EXPECT_EQ(drive.calls[n - 3].side, Side::LEFT);
  EXPECT_EQ(drive.calls[n - 3].speed_dps, 500);
  EXPECT_EQ(drive.calls[n - 3].degrees, 250);
  EXPECT_FALSE(drive.calls[n - 3].wait);
  EXPECT_EQ(drive.calls[n - 2].side, Side::RIGHT);
  EXPECT_EQ(drive.calls[n - 2].speed_dps, 500);
  EXPECT_TRUE(drive.calls[n - 2].wait);
  EXPECT_EQ(drive.calls[n - 1].kind, DriveCall::STOP);

  // Siren ran while driving, completion beep at the end
  EXPECT_GT(cue.beepsAt(900), 0u);
  EXPECT_GT(cue.beepsAt(600), 0u);
  EXPECT_EQ(cue.beeps.back().freq_hz, 1500);
}

TEST_F(RunControllerTest, ObstacleBeepsAndSpinsInPlace) {
  sensors.push(colorReading(Color::RED), 1 + 3);
  sensors.push(withDistance(colorReading(Color::YELLOW), 90));
  sensors.push(colorReading(Color::YELLOW));

  ASSERT_TRUE(runner.start("RECYCLING_OK"));
  for (int i = 0; i < 5; i++) runner.tick();

  EXPECT_EQ(cue.beepsAt(400), 1u);
  EXPECT_EQ(sink.countToken("ABORT_OBSTACLE distance_mm=90"), 1u);

  // stop, left spin, right spin (blocking), resume
  std::vector<DriveCall> calls = drive.calls;
  ASSERT_EQ(calls.size(), 5u);
  EXPECT_EQ(calls[0].kind, DriveCall::CONTINUOUS);
  EXPECT_EQ(calls[1].kind, DriveCall::STOP);

  EXPECT_EQ(calls[2].kind, DriveCall::ANGLE);
  EXPECT_EQ(calls[2].side, Side::LEFT);
  EXPECT_EQ(calls[2].speed_dps, 300);
  EXPECT_EQ(calls[2].degrees, 360);
  EXPECT_TRUE(calls[2].brake);
  EXPECT_FALSE(calls[2].wait);

  EXPECT_EQ(calls[3].side, Side::RIGHT);
  EXPECT_EQ(calls[3].speed_dps, -300);
  EXPECT_EQ(calls[3].degrees, 360);
  EXPECT_TRUE(calls[3].wait);

  EXPECT_EQ(calls[4].kind, DriveCall::CONTINUOUS);
  EXPECT_EQ(calls[4].left_dps, 200);

  // settle + turn settle
  EXPECT_EQ(clock.slept, 700u);
}

TEST_F(RunControllerTest, CancelStopsTheRun) {
  sensors.push(colorReading(Color::RED));
  ASSERT_TRUE(runner.start("OK"));
  runner.tick();

  runner.cancel();
  runner.tick();

  EXPECT_FALSE(runner.active());
  EXPECT_EQ(drive.calls.back().kind, DriveCall::STOP);
  EXPECT_EQ(sink.countToken("CANCELLED"), 1u);
  EXPECT_EQ(sink.countToken("DONE"), 0u);
  EXPECT_FALSE(cue.light);

  // Idle again: a new run is accepted
  EXPECT_TRUE(runner.start("OK"));
}

TEST_F(RunControllerTest, CancelWhileArrivingIsIgnored) {
  sensors.push(colorReading(Color::GREEN), 1 + 3);
  sensors.push(colorReading(Color::RED), 6);

  ASSERT_TRUE(runner.start("CONTAMINATED"));
  for (int i = 0; i < 50 && runner.navigator().phase() != NavPhase::ARRIVED; i++) runner.tick();
  ASSERT_EQ(runner.navigator().phase(), NavPhase::ARRIVED);

  runner.cancel();
  runner.tick();

  EXPECT_FALSE(runner.active());
  const std::vector<std::string> tokens = sink.tokens();
  ASSERT_GE(tokens.size(), 3u);
  EXPECT_EQ(tokens[tokens.size() - 3], "RED_REACHED");
  EXPECT_EQ(tokens[tokens.size() - 2], "ZONE=CONTAMINATED");
  EXPECT_EQ(tokens.back(), "DONE");
  EXPECT_EQ(sink.countToken("CANCELLED"), 0u);
  EXPECT_EQ(cue.beeps.back().freq_hz, 1500);
}

TEST_F(RunControllerTest, GreenYellowRedBoardRun) {
  sensors.push(colorReading(Color::GREEN), 1 + 3);   // init + warmup
  sensors.push(colorReading(Color::GREEN), 10);
  sensors.push(colorReading(Color::YELLOW), 10);
  sensors.push(colorReading(Color::RED), 5);

  ASSERT_TRUE(runner.start("CONTAMINATED"));
  tickUntilIdle();

  const std::vector<std::string> tokens = sink.tokens();
  ASSERT_GE(tokens.size(), 3u);
  EXPECT_EQ(tokens[tokens.size() - 3], "RED_REACHED");
  EXPECT_EQ(tokens[tokens.size() - 2], "ZONE=CONTAMINATED");
  EXPECT_EQ(tokens.back(), "DONE");
}

TEST_F(RunControllerTest, CancelWhenIdleIsIgnored) {
  runner.cancel();
  runner.tick();
  EXPECT_TRUE(sink.lines.empty());
  EXPECT_TRUE(drive.calls.empty());
}

TEST_F(RunControllerTest, CalibrationTogglesWhileIdle) {
  EXPECT_TRUE(runner.calibrate(true));
  EXPECT_TRUE(runner.calibrating());

  // Repeating the same state says nothing
  EXPECT_TRUE(runner.calibrate(true));

  EXPECT_TRUE(runner.calibrate(false));
  EXPECT_FALSE(runner.calibrating());

  const std::vector<std::string> expected = {"CALIBRATION=ON", "CALIBRATION=OFF"};
  EXPECT_EQ(sink.tokens(), expected);
  EXPECT_TRUE(drive.calls.empty());
}

TEST_F(RunControllerTest, CalibrationIsRejectedDuringRun) {
  sensors.push(colorReading(Color::RED));
  ASSERT_TRUE(runner.start("OK"));

  EXPECT_FALSE(runner.calibrate(true));
  EXPECT_FALSE(runner.calibrating());
  EXPECT_EQ(sink.countToken("REJECTED command=CALIBRATE"), 1u);
  EXPECT_TRUE(runner.active());
}

TEST_F(RunControllerTest, RunCommandEndsCalibration) {
  ASSERT_TRUE(runner.calibrate(true));
  ASSERT_TRUE(runner.start("OK"));

  EXPECT_FALSE(runner.calibrating());
  const std::vector<std::string> tokens = sink.tokens();
  ASSERT_GE(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], "CALIBRATION=ON");
  EXPECT_EQ(tokens[1], "CALIBRATION=OFF");
  EXPECT_EQ(tokens[2], "START scenario=RECYCLING_OK");
}

TEST_F(RunControllerTest, CancelEndsCalibration) {
  ASSERT_TRUE(runner.calibrate(true));
  runner.cancel();

  EXPECT_FALSE(runner.calibrating());
  EXPECT_EQ(sink.countToken("CALIBRATION=OFF"), 1u);
  EXPECT_EQ(sink.countToken("CANCELLED"), 0u);
}

TEST_F(RunControllerTest, MissingSensorsBecomeInvalidFields) {
  ASSERT_TRUE(runner.start("OK"));
  runner.tick();

  const SensorSample& s = runner.navigator().lastSample();
  EXPECT_FALSE(s.color_valid);
  EXPECT_FALSE(s.reflectance_valid);
  EXPECT_FALSE(s.distance_valid);
  EXPECT_EQ(runner.navigator().phase(), NavPhase::INIT);
}

TEST_F(RunControllerTest, ConfigIsSanitized) {
  NavConfig cfg = testConfig();
  cfg.hit_threshold = 0;
  cfg.turn_speed_dps = -300;
  RunController runner2(cfg, sensors, drive, cue, sink, clock);

  EXPECT_EQ(runner2.config().hit_threshold, 1);
  EXPECT_EQ(runner2.config().turn_speed_dps, 300);
}
