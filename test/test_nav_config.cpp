#include <gtest/gtest.h>

#include "TestConfig.h"
#include "nav/NavConfig.h"

TEST(NavConfig, ShippedValuesNeedNoFixes) {
  NavConfig cfg = testConfig();
  EXPECT_EQ(cfg.sanitize(), 0);
}

TEST(NavConfig, SwappedValidRangeIsRepaired) {
  NavConfig cfg = testConfig();
  cfg.classifier.valid_min = 25.0f;
  cfg.classifier.valid_max = 0.0f;

  EXPECT_EQ(cfg.sanitize(), 1);
  EXPECT_FLOAT_EQ(cfg.classifier.valid_min, 0.0f);
  EXPECT_FLOAT_EQ(cfg.classifier.valid_max, 25.0f);
}

TEST(NavConfig, ZeroCountsBecomeOne) {
  NavConfig cfg = testConfig();
  cfg.hit_threshold = 0;
  cfg.sample_period_ms = 0;
  cfg.effect_phase_ms = 0;

  EXPECT_EQ(cfg.sanitize(), 3);
  EXPECT_EQ(cfg.hit_threshold, 1);
  EXPECT_EQ(cfg.sample_period_ms, 1);
  EXPECT_EQ(cfg.effect_phase_ms, 1);
}

TEST(NavConfig, NegativeMagnitudesAreFlipped) {
  NavConfig cfg = testConfig();
  cfg.classifier.tolerance = -2.0f;
  cfg.drive_speed_dps = -200;
  cfg.turn_angle_deg = -360;

  EXPECT_EQ(cfg.sanitize(), 3);
  EXPECT_FLOAT_EQ(cfg.classifier.tolerance, 2.0f);
  EXPECT_EQ(cfg.drive_speed_dps, 200);
  EXPECT_EQ(cfg.turn_angle_deg, 360);
}

TEST(NavConfig, MostNegativeValuesClampToMaximum) {
  NavConfig cfg = testConfig();
  cfg.turbo_speed_dps = INT16_MIN;
  cfg.final_drive_angle_deg = INT32_MIN;

  EXPECT_EQ(cfg.sanitize(), 2);
  EXPECT_EQ(cfg.turbo_speed_dps, INT16_MAX);
  EXPECT_EQ(cfg.final_drive_angle_deg, INT32_MAX);
}

TEST(NavConfig, BadDefaultSlotResetsToFirst) {
  NavConfig cfg = testConfig();
  cfg.default_slot = 7;

  EXPECT_EQ(cfg.sanitize(), 1);
  EXPECT_EQ(cfg.default_slot, SLOT_FIRST);
}

TEST(BoardLayout, SlotLookup) {
  BoardLayout b = zones::standardBoard();
  EXPECT_EQ(b.slotOf(Color::GREEN), 0);
  EXPECT_EQ(b.slotOf(Color::YELLOW), 1);
  EXPECT_EQ(b.slotOf(Color::RED), 2);
  EXPECT_EQ(b.slotOf(Color::BLUE), SLOT_NONE);
  EXPECT_EQ(b.slotOf(Color::NONE), SLOT_NONE);
  EXPECT_EQ(b.at(3), Color::NONE);
}
