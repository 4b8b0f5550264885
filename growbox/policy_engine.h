#ifndef POLICY_ENGINE_H
#define POLICY_ENGINE_H

#include "grow_types.h"
#include "crop_profiles.h"

// =================================================================
// POLICY ENGINE
// =================================================================
// Pure: same reading + profile always gives the same intent. A channel that
// has not qualified yet never requests its actuators.

ActuatorIntent evaluatePolicy(const FilteredReading &reading, const ProfileThresholds &thresholds);

ActuatorIntent evaluatePolicy(const FilteredReading &reading, CropProfile profile);

#endif // POLICY_ENGINE_H
