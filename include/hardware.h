#ifndef HARDWARE_H
#define HARDWARE_H

#include <Arduino.h>
#include "config.h"

#define SPEAKER_HOLD_MS 1000  // holding the mute button this long toggles the speaker

enum LedPattern {
  LED_OFF,
  LED_ON,          // call connected
  LED_BLINK_SLOW,  // connecting / reconnecting
  LED_BLINK_FAST   // no network or call failed
};

enum ButtonEvent {
  BUTTON_NONE,
  BUTTON_CALL,     // start or end the call
  BUTTON_MUTE,
  BUTTON_SPEAKER
};

void initHardware();

// Debounced; returns at most one event per call
ButtonEvent pollButtons();

void setStatusLed(LedPattern pattern);
void updateStatusLed();

#endif
