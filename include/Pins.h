#pragma once
#include <Arduino.h>

/*
  Pins.h

  Purpose:
  Central location for all Arduino pin assignments for the sorter robot.
  Keeps hardware mapping explicit, readable, and easy to modify.

  Board:
  Arduino Mega 2560

  Notes:
  - Encoder channel A pins are external interrupts
  - Motor drivers use direction + PWM (DRV8871)
  - TCS3200 output is read with pulseIn()
  - Ultrasonic uses regular digital GPIO
*/

/* ============================================================================
   DRV8871 MOTOR DRIVER PINS
   IN1 = Direction
   IN2 = PWM
============================================================================ */

// Left Drive Motor
constexpr uint8_t PIN_LEFT_DRIVE_DIR = 30; // IN1
constexpr uint8_t PIN_LEFT_DRIVE_PWM = 5;  // IN2 (PWM)

// Right Drive Motor
constexpr uint8_t PIN_RIGHT_DRIVE_DIR = 31; // IN1
constexpr uint8_t PIN_RIGHT_DRIVE_PWM = 6;  // IN2 (PWM)

/* ============================================================================
   QUADRATURE ENCODER PINS
   Channel A = External Interrupt
============================================================================ */

constexpr uint8_t PIN_ENC_LEFT_A = 2;   // INT0
constexpr uint8_t PIN_ENC_LEFT_B = 20;  // INT1

constexpr uint8_t PIN_ENC_RIGHT_A = 3;  // INT1
constexpr uint8_t PIN_ENC_RIGHT_B = 21; // INT2

/* ============================================================================
   TCS3200 COLOR SENSOR (pointing down at the board)
============================================================================ */

constexpr uint8_t PIN_TCS_S0  = 22;
constexpr uint8_t PIN_TCS_S1  = 23;
constexpr uint8_t PIN_TCS_S2  = 24;
constexpr uint8_t PIN_TCS_S3  = 25;
constexpr uint8_t PIN_TCS_OUT = 26;
constexpr uint8_t PIN_TCS_LED = 27;   // on-board illumination LEDs

/* ============================================================================
   ULTRASONIC DISTANCE SENSOR (HC-SR04, pointing forward)
============================================================================ */

constexpr uint8_t PIN_ULTRASONIC_TRIG = 8;
constexpr uint8_t PIN_ULTRASONIC_ECHO = 7;

/* ============================================================================
   CUES
============================================================================ */

constexpr uint8_t PIN_BUZZER = 9;
constexpr uint8_t PIN_STATUS_LED = LED_BUILTIN;

/* ============================================================================
   SERIAL INTERFACES
============================================================================ */

// USB Serial (Bridge <-> Robot)
#define SERIAL_USB Serial
