#ifndef FAULT_ARBITER_H
#define FAULT_ARBITER_H

#include "grow_types.h"

struct FaultPolicy {
  // Also fault when every channel has qualified at Low
  bool faultOnAllLow = true;
};

// Heater and cooler requested together
bool contradictoryDemand(const ActuatorIntent &intent);

// All four channels qualified and at their most stressed level
bool extremeReadings(const FilteredReading &reading);

// Applies the override mask and derives the fault flag for this tick.
// With the override set every actuator and the fault read 0.
FinalActuatorState arbitrate(const ActuatorIntent &intent,
                             const FilteredReading &reading,
                             bool overrideActive,
                             const FaultPolicy &policy);

#endif // FAULT_ARBITER_H
