#pragma once
#include <Arduino.h>

#include "nav/Ports.h"

/*
  Indicator

  CuePort on a piezo buzzer and a status LED. tone() with a duration runs
  from a timer interrupt, so beep() returns immediately.
*/
class Indicator : public CuePort {
public:
  Indicator(uint8_t buzzer_pin, uint8_t led_pin)
  : _buzzer_pin(buzzer_pin), _led_pin(led_pin) {}

  void begin() {
    pinMode(_buzzer_pin, OUTPUT);
    pinMode(_led_pin, OUTPUT);
    noTone(_buzzer_pin);
    digitalWrite(_led_pin, LOW);
  }

  void beep(uint16_t freq_hz, uint16_t duration_ms) override {
    tone(_buzzer_pin, freq_hz, duration_ms);
  }

  void setLight(bool on) override {
    digitalWrite(_led_pin, on ? HIGH : LOW);
  }

private:
  uint8_t _buzzer_pin;
  uint8_t _led_pin;
};
