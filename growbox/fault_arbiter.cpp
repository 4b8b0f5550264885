#include "fault_arbiter.h"

bool contradictoryDemand(const ActuatorIntent &intent) {
  return intent.heater && intent.cooler;
}

bool extremeReadings(const FilteredReading &reading) {
  for (int ch = 0; ch < NUM_CHANNELS; ch++) {
    if (!reading.valid[ch] || reading.level[ch] != LEVEL_LOW) return false;
  }
  return true;
}

FinalActuatorState arbitrate(const ActuatorIntent &intent,
                             const FilteredReading &reading,
                             bool overrideActive,
                             const FaultPolicy &policy) {
  FinalActuatorState out;
  if (overrideActive) {
    return out;
  }

  out.actuators = intent;
  out.fault = contradictoryDemand(intent) ||
              (policy.faultOnAllLow && extremeReadings(reading));
  return out;
}
