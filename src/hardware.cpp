#include "hardware.h"
#include "production_logger.h"

struct ButtonState {
  int pin;
  bool pressed;
  unsigned long lastChange;
  unsigned long pressedAt;
};

static ButtonState callButton = {CALL_BUTTON_PIN, false, 0, 0};
static ButtonState muteButton = {MUTE_BUTTON_PIN, false, 0, 0};

static LedPattern ledPattern = LED_OFF;
static bool ledLevel = false;
static unsigned long ledToggledAt = 0;

void initHardware() {
  pinMode(CALL_BUTTON_PIN, INPUT_PULLUP);
  pinMode(MUTE_BUTTON_PIN, INPUT_PULLUP);
  pinMode(STATUS_LED_PIN, OUTPUT);
  digitalWrite(STATUS_LED_PIN, LOW);

  VB_LOG_INFO(LOG_SYSTEM, "Hardware initialized",
              "call=" + String(CALL_BUTTON_PIN) + " mute=" + String(MUTE_BUTTON_PIN));
}

// Returns true on a debounced edge; `pressed` holds the new level
static bool readEdge(ButtonState& button, unsigned long now) {
  bool level = digitalRead(button.pin) == LOW;
  if (level == button.pressed) return false;
  if (now - button.lastChange < DEBOUNCE_DELAY) return false;

  button.pressed = level;
  button.lastChange = now;
  if (level) button.pressedAt = now;
  return true;
}

ButtonEvent pollButtons() {
  unsigned long now = millis();

  if (readEdge(callButton, now) && callButton.pressed) {
    return BUTTON_CALL;
  }

  if (readEdge(muteButton, now) && !muteButton.pressed) {
    return (now - muteButton.pressedAt >= SPEAKER_HOLD_MS) ? BUTTON_SPEAKER : BUTTON_MUTE;
  }
  return BUTTON_NONE;
}

void setStatusLed(LedPattern pattern) {
  if (pattern == ledPattern) return;
  ledPattern = pattern;
  ledToggledAt = millis();
  ledLevel = pattern == LED_ON || pattern == LED_BLINK_SLOW || pattern == LED_BLINK_FAST;
  digitalWrite(STATUS_LED_PIN, ledLevel ? HIGH : LOW);
}

void updateStatusLed() {
  unsigned long period;
  switch (ledPattern) {
    case LED_BLINK_SLOW: period = 500; break;
    case LED_BLINK_FAST: period = 125; break;
    default: return;
  }

  unsigned long now = millis();
  if (now - ledToggledAt >= period) {
    ledToggledAt = now;
    ledLevel = !ledLevel;
    digitalWrite(STATUS_LED_PIN, ledLevel ? HIGH : LOW);
  }
}
