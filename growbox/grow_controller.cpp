#include "grow_controller.h"

// Bit offsets of each channel inside input word A
static const uint8_t CHANNEL_SHIFT[NUM_CHANNELS] = {
  6,  // soil
  4,  // light
  2,  // humidity
  0   // temperature
};

SensorLevel decodeSensorCode(uint8_t code) {
  code &= SENSOR_CODE_MASK;
  if (code == SENSOR_CODE_RESERVED) return LEVEL_HIGH;
  return static_cast<SensorLevel>(code);
}

SensorReading decodeSensorWord(uint8_t wordA) {
  SensorReading reading;
  for (int ch = 0; ch < NUM_CHANNELS; ch++) {
    reading.level[ch] = decodeSensorCode(wordA >> CHANNEL_SHIFT[ch]);
  }
  return reading;
}

uint8_t encodeSensorWord(const SensorReading &reading) {
  uint8_t word = 0;
  for (int ch = 0; ch < NUM_CHANNELS; ch++) {
    word |= (uint8_t)((reading.level[ch] & SENSOR_CODE_MASK) << CHANNEL_SHIFT[ch]);
  }
  return word;
}

ControlInputs decodeControlWord(uint8_t wordB) {
  ControlInputs in;
  in.overrideActive = (wordB & CTRL_BIT_OVERRIDE) != 0;
  in.profile = profileFromSelect(wordB >> CTRL_PROFILE_SHIFT);
  return in;
}

uint8_t encodeOutputWord(const FinalActuatorState &state, bool heartbeat) {
  uint8_t word = 0;
  if (state.actuators.pump)         word |= OUT_BIT_PUMP;
  if (state.actuators.heater)       word |= OUT_BIT_HEATER;
  if (state.actuators.cooler)       word |= OUT_BIT_COOLER;
  if (state.actuators.light)        word |= OUT_BIT_LIGHT;
  if (state.fault)                  word |= OUT_BIT_FAULT;
  if (heartbeat)                    word |= OUT_BIT_HEARTBEAT;
  if (state.actuators.dehumidifier) word |= OUT_BIT_DEHUMIDIFIER;
  return word;
}

uint8_t statusByte(const FinalActuatorState &state) {
  return encodeOutputWord(state, false);
}

// =================================================================
// CONTROLLER
// =================================================================

GrowController::GrowController(const ControllerConfig &config)
  : config(config),
    filter(config.filterQualifyTicks),
    tx(bitPeriodTicks(config.tickHz, config.telemetryBaud)) {
  Reset();
}

void GrowController::Reset() {
  filter.Reset();
  tx.Reset();
  controls = ControlInputs();
  intent = ActuatorIntent();
  finalState = FinalActuatorState();
  faultQ = false;
  statusQ = 0;
  tickCount = 0;
}

OutputWords GrowController::Tick(uint8_t wordA, uint8_t wordB, bool heartbeat) {
  // 1. Transmitter sees last tick's finalized fault
  tx.Tick(faultQ, statusQ);

  // 2. Filter -> policy -> arbiter on this tick's inputs
  controls = decodeControlWord(wordB);
  filter.Tick(decodeSensorWord(wordA));
  intent = evaluatePolicy(filter.Reading(), controls.profile);
  finalState = arbitrate(intent, filter.Reading(), controls.overrideActive, config.faultPolicy);

  // 3. Register for the next tick
  faultQ = finalState.fault;
  statusQ = statusByte(finalState);
  tickCount++;

  OutputWords out;
  out.a = encodeOutputWord(finalState, heartbeat);
  out.b = tx.Line() ? OUT_BIT_TELEMETRY : 0;
  return out;
}
