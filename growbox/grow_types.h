#ifndef GROW_TYPES_H
#define GROW_TYPES_H

#include <stdint.h>

// =================================================================
// SHARED TYPES (no Arduino dependency, used by the decision core)
// =================================================================

enum SensorLevel {
  LEVEL_LOW  = 0,
  LEVEL_MID  = 1,
  LEVEL_HIGH = 2
};

enum SensorChannel {
  CHANNEL_SOIL        = 0,
  CHANNEL_LIGHT       = 1,
  CHANNEL_HUMIDITY    = 2,
  CHANNEL_TEMPERATURE = 3,
  NUM_CHANNELS        = 4
};

enum CropProfile {
  PROFILE_RADISH     = 0,
  PROFILE_BASIL      = 1,
  PROFILE_PEA_SHOOTS = 2,
  PROFILE_SUNFLOWER  = 3,
  NUM_PROFILES       = 4
};

// One raw sample of the four quantized channels
struct SensorReading {
  SensorLevel level[NUM_CHANNELS] = {LEVEL_HIGH, LEVEL_HIGH, LEVEL_HIGH, LEVEL_HIGH};
};

// Debounced channels. A channel is not valid until it has qualified once.
struct FilteredReading {
  SensorLevel level[NUM_CHANNELS] = {LEVEL_HIGH, LEVEL_HIGH, LEVEL_HIGH, LEVEL_HIGH};
  bool valid[NUM_CHANNELS]        = {false, false, false, false};
};

struct ActuatorStates {
  bool pump         = false;
  bool heater       = false;
  bool cooler       = false;
  bool light        = false;
  bool dehumidifier = false;
};

typedef ActuatorStates ActuatorIntent;

struct FinalActuatorState {
  ActuatorStates actuators;
  bool fault = false;
};

// Input word B, decoded
struct ControlInputs {
  bool overrideActive = false;
  CropProfile profile = PROFILE_RADISH;
};

struct OutputWords {
  uint8_t a = 0;
  uint8_t b = 0x80;  // telemetry line idles high
};

// =================================================================
// WORD LAYOUTS
// =================================================================

// Input word A: 2-bit codes packed soil(7:6) light(5:4) humidity(3:2) temp(1:0)
const uint8_t SENSOR_CODE_MASK     = 0x03;
const uint8_t SENSOR_CODE_RESERVED = 3;

// Input word B
const uint8_t CTRL_BIT_OVERRIDE    = 0x01;
const uint8_t CTRL_PROFILE_SHIFT   = 1;
const uint8_t CTRL_PROFILE_MASK    = 0x03;

// Output word A
const uint8_t OUT_BIT_PUMP         = 0x01;
const uint8_t OUT_BIT_HEATER       = 0x02;
const uint8_t OUT_BIT_COOLER       = 0x04;
const uint8_t OUT_BIT_LIGHT        = 0x08;
const uint8_t OUT_BIT_FAULT        = 0x10;
const uint8_t OUT_BIT_HEARTBEAT    = 0x20;
const uint8_t OUT_BIT_DEHUMIDIFIER = 0x40;

// Output word B
const uint8_t OUT_BIT_TELEMETRY    = 0x80;

#endif // GROW_TYPES_H
