#include "hal.h"

void initializePins() {
  Serial.println("Initializing pins...");
  for (int i = 0; i < 8; i++) {
    pinMode(SENSOR_WORD_PINS[i], INPUT);
  }
  pinMode(OVERRIDE_PIN,     INPUT_PULLUP);
  pinMode(PROFILE_SEL0_PIN, INPUT_PULLUP);
  pinMode(PROFILE_SEL1_PIN, INPUT_PULLUP);

  pinMode(RELAY_PIN_PUMP,         OUTPUT); digitalWrite(RELAY_PIN_PUMP,         RELAY_OFF);
  pinMode(RELAY_PIN_HEATER,       OUTPUT); digitalWrite(RELAY_PIN_HEATER,       RELAY_OFF);
  pinMode(RELAY_PIN_COOLER,       OUTPUT); digitalWrite(RELAY_PIN_COOLER,       RELAY_OFF);
  pinMode(RELAY_PIN_LIGHT,        OUTPUT); digitalWrite(RELAY_PIN_LIGHT,        RELAY_OFF);
  pinMode(RELAY_PIN_DEHUMIDIFIER, OUTPUT); digitalWrite(RELAY_PIN_DEHUMIDIFIER, RELAY_OFF);

  pinMode(FAULT_LED_PIN,     OUTPUT); digitalWrite(FAULT_LED_PIN,     LOW);
  pinMode(HEARTBEAT_LED_PIN, OUTPUT); digitalWrite(HEARTBEAT_LED_PIN, LOW);

  // Telemetry line idles high (mark)
  pinMode(TELEMETRY_TX_PIN, OUTPUT);
  digitalWrite(TELEMETRY_TX_PIN, HIGH);
}

void initializeSensors() {
  Serial.println("Initializing sensors...");
  Wire.begin();
  if (!rtc.begin()) {
    Serial.println("Couldn't find RTC! Check wiring.");
    rtcAvailable = false;
  } else {
    Serial.println("RTC found.");
    rtcAvailable = true;
  }
}

uint8_t readSensorWord() {
  uint8_t word = 0;
  for (int i = 0; i < 8; i++) {
    word = (uint8_t)((word << 1) | (digitalRead(SENSOR_WORD_PINS[i]) == HIGH ? 1 : 0));
  }
  return word;
}

// Switches pull to ground when closed
uint8_t readControlWord() {
  uint8_t word = 0;
  if (digitalRead(OVERRIDE_PIN) == LOW)     word |= CTRL_BIT_OVERRIDE;
  if (digitalRead(PROFILE_SEL0_PIN) == LOW) word |= (1 << CTRL_PROFILE_SHIFT);
  if (digitalRead(PROFILE_SEL1_PIN) == LOW) word |= (2 << CTRL_PROFILE_SHIFT);
  return word;
}

void applyOutputWords(const OutputWords &out) {
  digitalWrite(RELAY_PIN_PUMP,         (out.a & OUT_BIT_PUMP)         ? RELAY_ON : RELAY_OFF);
  digitalWrite(RELAY_PIN_HEATER,       (out.a & OUT_BIT_HEATER)       ? RELAY_ON : RELAY_OFF);
  digitalWrite(RELAY_PIN_COOLER,       (out.a & OUT_BIT_COOLER)       ? RELAY_ON : RELAY_OFF);
  digitalWrite(RELAY_PIN_LIGHT,        (out.a & OUT_BIT_LIGHT)        ? RELAY_ON : RELAY_OFF);
  digitalWrite(RELAY_PIN_DEHUMIDIFIER, (out.a & OUT_BIT_DEHUMIDIFIER) ? RELAY_ON : RELAY_OFF);

  digitalWrite(FAULT_LED_PIN,     (out.a & OUT_BIT_FAULT)     ? HIGH : LOW);
  digitalWrite(HEARTBEAT_LED_PIN, (out.a & OUT_BIT_HEARTBEAT) ? HIGH : LOW);
  digitalWrite(TELEMETRY_TX_PIN,  (out.b & OUT_BIT_TELEMETRY) ? HIGH : LOW);
}
