/*
  Sortbot Arduino Controller

  Purpose:
  Drives across the three colored zones of the sorting board and stops on
  the zone that matches the command received over USB serial.

  Loop tasks:
  - RX: SerialLink.tick() receives run/cancel/calibrate frames
  - NAV: RunController.tick() once per SAMPLE_MS (sensors -> state machine -> motors)
  - DRIVE: DriveTrain.service() finishes non-blocking angle moves
  - TX: telemetry at TELEMETRY_UPDATE_HZ so the bridge can follow the run
  - CAL: raw sensor readout at CALIBRATION_UPDATE_HZ while calibration mode is on
*/

#include <Arduino.h>

#include "Pins.h"
#include "Params.h"

#include "utils/Rate.h"
#include "comms/SerialLink.h"
#include "sensors/ColorSensor.h"
#include "sensors/DistanceSensor.h"
#include "sensors/EncoderSensor.h"
#include "sensors/SensorHub.h"
#include "actuators/DcMotorActuator.h"
#include "actuators/DriveTrain.h"
#include "actuators/Indicator.h"
#include "nav/RunController.h"



/*=============================================================================
  CONFIG
=============================================================================*/

static NavConfig makeNavConfig() {
  NavConfig cfg;

  ClassifierConfig& c = cfg.classifier;
  c.board = BOARD_BLUE_MIDDLE ? zones::blueMiddleBoard() : zones::standardBoard();
  c.calibration[SLOT_FIRST]  = CAL_GREEN;
  c.calibration[SLOT_MIDDLE] = CAL_MIDDLE;
  c.calibration[SLOT_LAST]   = CAL_RED;
  c.tolerance = ZONE_TOLERANCE;
  c.valid_min = VALID_RANGE_MIN;
  c.valid_max = VALID_RANGE_MAX;
  c.policy = CLASSIFY_NEAREST ? FallbackPolicy::NEAREST : FallbackPolicy::TOLERANCE_WINDOW;

  cfg.drive_speed_dps = DRIVE_SPEED_DPS;
  cfg.turbo_speed_dps = TURBO_SPEED_DPS;
  cfg.sample_period_ms = SAMPLE_MS;
  cfg.hit_threshold = CONSECUTIVE_TARGET_HITS;
  cfg.warmup_samples = WARMUP_SAMPLES;
  cfg.stop_distance_mm = STOP_DISTANCE_MM;
  cfg.final_drive_angle_deg = FINAL_DRIVE_ANGLE_DEG;
  cfg.turn_angle_deg = TURN_ANGLE_DEG;
  cfg.turn_speed_dps = TURN_SPEED_DPS;
  cfg.settle_ms = SENSOR_SETTLE_MS;
  cfg.turn_settle_ms = TURN_SETTLE_MS;
  cfg.effect_phase_ms = SIREN_PHASE_MS;
  cfg.unknown_policy = UNKNOWN_COMMAND_USES_DEFAULT ? UnknownCommandPolicy::DEFAULT_ZONE
                                                    : UnknownCommandPolicy::REJECT;
  cfg.default_slot = DEFAULT_TARGET_SLOT;
  cfg.debug_enabled = ENABLE_SERIAL_DEBUG;

  return cfg;
}

static ColorSensor::Calibration makeColorCalibration() {
  ColorSensor::Calibration cal;
  cal.clear_white_us = TCS_WHITE_PERIOD_US;
  cal.clear_black_us = TCS_BLACK_PERIOD_US;
  cal.rgb_white_us = TCS_RGB_WHITE_PERIOD_US;
  cal.rgb_black_us = TCS_RGB_BLACK_PERIOD_US;
  cal.dominance = TCS_DOMINANCE;
  cal.min_intensity_sum = TCS_MIN_INTENSITY_SUM;
  return cal;
}

// Clock over millis()/delay()
class ArduinoClock : public Clock {
public:
  uint32_t nowMs() override { return millis(); }
  void sleepMs(uint32_t ms) override { delay(ms); }
};


/*=============================================================================
  GLOBALS
=============================================================================*/

// Serial link (USB)
SerialLink g_link(SERIAL_USB);

// Sensors
ColorSensor g_color_sensor(PIN_TCS_S0, PIN_TCS_S1, PIN_TCS_S2, PIN_TCS_S3, PIN_TCS_OUT, PIN_TCS_LED,
                           TCS_PULSE_TIMEOUT_US, makeColorCalibration());

DistanceSensor g_distance_sensor(PIN_ULTRASONIC_TRIG, PIN_ULTRASONIC_ECHO, ULTRASONIC_MAX_DISTANCE_CM,
                                 ULTRASONIC_TIMEOUT_US, ULTRASONIC_MIN_MM, ULTRASONIC_MAX_RANGE_MM);

EncoderSensor g_left_encoder(PIN_ENC_LEFT_A, PIN_ENC_LEFT_B, COUNTS_PER_WHEEL_REV, LEFT_ENCODER_INVERTED);
EncoderSensor g_right_encoder(PIN_ENC_RIGHT_A, PIN_ENC_RIGHT_B, COUNTS_PER_WHEEL_REV, RIGHT_ENCODER_INVERTED);

SensorHub g_sensors(g_color_sensor, g_distance_sensor);

// Actuators
DcMotorActuator g_left_motor(PIN_LEFT_DRIVE_DIR, PIN_LEFT_DRIVE_PWM, LEFT_MOTOR_INVERTED,
                             MIN_MOVING_DUTY, PWM_MIN, PWM_MAX);
DcMotorActuator g_right_motor(PIN_RIGHT_DRIVE_DIR, PIN_RIGHT_DRIVE_PWM, RIGHT_MOTOR_INVERTED,
                              MIN_MOVING_DUTY, PWM_MIN, PWM_MAX);

DriveTrain g_drive(g_left_motor, g_right_motor, g_left_encoder, g_right_encoder,
                   MAX_WHEEL_DPS, ANGLE_MOVE_TIMEOUT_MS);

Indicator g_indicator(PIN_BUZZER, PIN_STATUS_LED);

ArduinoClock g_clock;

// Navigation
RunController g_runner(makeNavConfig(), g_sensors, g_drive, g_indicator, g_link, g_clock);

// Rates
Rate g_comms_rate(RxCOMM_UPDATE_HZ);                    // RX parsing tick (fast, non-blocking)
Rate g_telemetry_rate(TELEMETRY_UPDATE_HZ);
Rate g_calibration_rate(CALIBRATION_UPDATE_HZ);
Rate g_nav_rate;


/*=============================================================================
  HELPERS
=============================================================================*/

static void handleCommand(const CommandFrame& cmd) {
  switch (cmd.type) {
    case CommandType::RUN:
      g_runner.start(cmd.command);
      // start() may block for the sensor settle time; keep the sample grid honest
      g_nav_rate.reset();
      break;

    case CommandType::CANCEL:
      g_runner.cancel();
      break;

    case CommandType::CALIBRATE:
      if (g_runner.calibrate(cmd.enable) && cmd.enable) {
        g_calibration_rate.reset();
      }
      break;

    default:
      break;
  }
}

static void sendTelemetry(uint32_t now_ms) {
  const Navigator& nav = g_runner.navigator();
  const RunState& st = nav.state();
  const SensorSample& s = nav.lastSample();

  TelemetryFrame t;
  t.arduino_time_ms = now_ms;
  t.ack_seq = g_link.ackSeq();     // ACK = last received + parsed command seq

  t.run_active = g_runner.active();
  t.phase = nav.begun() ? nav::phaseName(st.phase) : "IDLE";
  t.target = nav.begun() ? zones::colorName(nav.selection().target) : nullptr;
  t.zone = st.zone_valid ? zones::colorName(st.zone) : nullptr;

  t.hits = st.consecutive_hits;
  t.samples = st.sample_counter;

  t.reflectance.raw = s.raw_reflectance;
  t.reflectance.raw_valid = s.reflectance_valid;
  t.reflectance.smoothed = s.smoothed_reflectance;

  t.distance_mm = s.distance_mm;
  t.distance_valid = s.distance_valid;

  t.link = g_link.stats();
  t.drive_timeouts = g_drive.timeouts();

  t.note = g_link.debugNote(now_ms);

  g_link.sendTelemetry(t);
}

// One raw readout of every board-facing sensor for threshold tuning
static void sendCalibration(uint32_t now_ms) {
  CalibrationFrame c;
  c.arduino_time_ms = now_ms;

  c.reflectance_valid = g_color_sensor.readReflection(c.reflectance);
  c.ambient_valid = g_color_sensor.readAmbient(c.ambient);

  Color color = Color::NONE;
  if (g_color_sensor.readColor(color)) c.color = zones::colorName(color);

  const ColorSensor::State& st = g_color_sensor.getState();
  c.r_us = st.r_us;
  c.g_us = st.g_us;
  c.b_us = st.b_us;
  c.clear_us = st.clear_us;

  c.distance_valid = g_distance_sensor.measure(now_ms, c.distance_mm);

  g_link.sendCalibration(c);
}


/*=============================================================================
  SETUP
=============================================================================*/

void setup() {
  // Serial Comms Setup
  SERIAL_USB.begin(SERIAL_BAUD);
  g_link.begin();

  // Sensor Setup
  g_color_sensor.begin();
  g_distance_sensor.begin();

  // Drive + Cue Setup
  g_drive.begin();
  g_indicator.begin();

  g_nav_rate.setPeriodMs(g_runner.config().sample_period_ms);
}

/*=============================================================================
  LOOP
=============================================================================*/

void loop() {

  const uint32_t now_ms = millis();

  // RX tick: read serial and apply queued commands in arrival order
  if (g_comms_rate.ready(now_ms)) {
    g_link.tick(now_ms);

    CommandFrame cmd;
    while (g_link.takeCommand(cmd)) {
      handleCommand(cmd);
    }
  }

  // Finish angle moves started without waiting
  g_drive.service(now_ms);

  // Navigation tick: one sample per period while a run is active
  if (g_runner.active() && g_nav_rate.ready(now_ms)) {
    g_runner.tick();
  }

  // Calibration readout (idle only; a run ends calibration mode)
  if (g_runner.calibrating() && g_calibration_rate.ready(now_ms)) {
    sendCalibration(now_ms);
  }

  // TX tick: publish telemetry so the bridge can follow the run
  if (g_telemetry_rate.ready(now_ms)) {
    sendTelemetry(now_ms);
  }
}
