#pragma once
#include <Arduino.h>

/*
  Params.h

  Purpose:
  Central location for robot constants and tunable parameters.
  main.cpp copies the navigation values into a NavConfig; the nav/ core
  never includes this file.

  Board:
  Arduino Mega 2560

  Convention:
  - Distances: millimeters (mm)
  - Wheel speeds: degrees per second (deg/s)
  - Wheel angles: degrees
  - Reflectance: percent (0..100) from the TCS3200 clear channel
*/

/* ============================================================================
   BOARD LAYOUT / ZONE CALIBRATION
============================================================================ */

// Physical order on the board: GREEN -> YELLOW -> RED
// (set BOARD_BLUE_MIDDLE for the GREEN -> BLUE -> RED board)
constexpr bool BOARD_BLUE_MIDDLE = false;

// Reference reflectance per zone (percent), measured with calibrate mode
constexpr float CAL_GREEN  = 13.0f;
constexpr float CAL_MIDDLE = 16.0f;   // YELLOW (or BLUE)
constexpr float CAL_RED    = 6.0f;

// How close the smoothed reading must be to count (+/-)
constexpr float ZONE_TOLERANCE = 2.0f;

// Filter out readings that are way off
constexpr float VALID_RANGE_MIN = 0.0f;
constexpr float VALID_RANGE_MAX = 25.0f;

// false = tolerance window, true = nearest calibration value
constexpr bool CLASSIFY_NEAREST = false;

/* ============================================================================
   NAVIGATION
============================================================================ */

constexpr int16_t DRIVE_SPEED_DPS = 200;
constexpr int16_t TURBO_SPEED_DPS = 500;    // CONTAMINATED (hazard) runs

constexpr uint16_t SAMPLE_MS = 30;
constexpr uint8_t  CONSECUTIVE_TARGET_HITS = 5;
constexpr uint16_t WARMUP_SAMPLES = 40;     // ~1.2 s of driving off the start zone

constexpr uint16_t STOP_DISTANCE_MM = 150;

constexpr int32_t FINAL_DRIVE_ANGLE_DEG = 250;

constexpr int32_t TURN_ANGLE_DEG = 360;
constexpr int16_t TURN_SPEED_DPS = 300;

constexpr uint16_t SENSOR_SETTLE_MS = 500;
constexpr uint16_t TURN_SETTLE_MS = 200;

constexpr uint16_t SIREN_PHASE_MS = 400;

// true = unknown commands run toward DEFAULT_TARGET_SLOT instead of being rejected
constexpr bool UNKNOWN_COMMAND_USES_DEFAULT = false;
constexpr uint8_t DEFAULT_TARGET_SLOT = 0;  // first zone

/* ============================================================================
   DRIVE TRAIN
============================================================================ */

// Encoder hardware
constexpr int ENCODER_CPR = 48;            // counts per motor shaft rev
constexpr int QUADRATURE_FACTOR = 4;       // x4 decoding
constexpr float DRIVE_GEAR_RATIO = 2.0f;   // motor : wheel

// Derived counts
constexpr float COUNTS_PER_WHEEL_REV =
    ENCODER_CPR * QUADRATURE_FACTOR * DRIVE_GEAR_RATIO;

// Wheel speed at full duty (open loop speed -> duty mapping)
constexpr float MAX_WHEEL_DPS = 720.0f;

// Smallest duty that still turns the wheels on carpet/board
constexpr float MIN_MOVING_DUTY = 0.18f;

// PWM limits
constexpr uint8_t PWM_MIN = 0;
constexpr uint8_t PWM_MAX = 255;

// Give up on an angle move that has not finished in this time (stall)
constexpr uint32_t ANGLE_MOVE_TIMEOUT_MS = 4000;

// Right side is mirrored on the chassis
constexpr bool LEFT_MOTOR_INVERTED = false;
constexpr bool RIGHT_MOTOR_INVERTED = true;
constexpr bool LEFT_ENCODER_INVERTED = false;
constexpr bool RIGHT_ENCODER_INVERTED = true;

/* ============================================================================
   COLOR SENSOR (TCS3200)
============================================================================ */

// pulseIn() cap per channel
constexpr uint32_t TCS_PULSE_TIMEOUT_US = 10000UL;

// Clear channel period on white paper / black tape (shorter = brighter)
constexpr uint32_t TCS_WHITE_PERIOD_US = 40UL;
constexpr uint32_t TCS_BLACK_PERIOD_US = 900UL;

// A channel must exceed the others by this factor to name a color
constexpr float TCS_DOMINANCE = 1.25f;

// Sum of R+G+B intensities (0..255 each) below this is too dark to name
constexpr uint16_t TCS_MIN_INTENSITY_SUM = 120;

// Normalization periods for R/G/B (white, black)
constexpr uint32_t TCS_RGB_WHITE_PERIOD_US = 60UL;
constexpr uint32_t TCS_RGB_BLACK_PERIOD_US = 1200UL;

/* ============================================================================
   ULTRASONIC SENSOR (HC-SR04)
============================================================================ */

// What range do we actually care about for the robot?
// Keeping this smaller makes ultrasonic reads faster and reduces blocking.
constexpr uint16_t ULTRASONIC_MIN_MM = 20;
constexpr uint16_t ULTRASONIC_MAX_RANGE_MM = 1000;

// Martinsos library uses max distance in centimeters
constexpr uint16_t ULTRASONIC_MAX_DISTANCE_CM = ULTRASONIC_MAX_RANGE_MM / 10;

// Speed of sound (for computing a reasonable timeout from desired range)
constexpr float SPEED_OF_SOUND_CMPS = 34300.0f;    // ~20 C

// Round-trip time to ULTRASONIC_MAX_DISTANCE_CM with a 25% margin
constexpr uint32_t ULTRASONIC_TIMEOUT_US_FROM_RANGE =
    (uint32_t)(1.25f * (2.0f * ULTRASONIC_MAX_DISTANCE_CM / SPEED_OF_SOUND_CMPS) * 1000000.0f);

// Hard cap on pulseIn() blocking; must stay well under SAMPLE_MS
constexpr uint32_t ULTRASONIC_TIMEOUT_US_HARD = 12000UL;  // 12 ms

constexpr uint32_t ULTRASONIC_TIMEOUT_US =
    (ULTRASONIC_TIMEOUT_US_FROM_RANGE < ULTRASONIC_TIMEOUT_US_HARD)
      ? ULTRASONIC_TIMEOUT_US_FROM_RANGE
      : ULTRASONIC_TIMEOUT_US_HARD;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t RxCOMM_UPDATE_HZ    = 200;
constexpr uint16_t TELEMETRY_UPDATE_HZ = 5;

// Raw sensor readout while calibration mode is on
constexpr uint16_t CALIBRATION_UPDATE_HZ = 5;

/* ============================================================================
   TELEMETRY / COMMS
============================================================================ */

constexpr uint32_t SERIAL_BAUD = 115200;
constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 160;
constexpr uint16_t TELEMETRY_LINE_BYTES = 512;   // also used for calibration lines

/* ============================================================================
   DEBUG FLAGS
============================================================================ */

// DEBUG lines on the status port (noisy, slows the loop)
constexpr bool ENABLE_SERIAL_DEBUG = false;
