#ifndef CROP_PROFILES_H
#define CROP_PROFILES_H

#include "grow_types.h"

// Set of levels at which a trigger fires
typedef uint8_t LevelMask;

const LevelMask TRIGGER_NEVER = 0x00;
const LevelMask TRIGGER_LOW   = 1 << LEVEL_LOW;
const LevelMask TRIGGER_MID   = 1 << LEVEL_MID;
const LevelMask TRIGGER_HIGH  = 1 << LEVEL_HIGH;

struct ProfileThresholds {
  const char* name;
  LevelMask heatTriggerLevel;
  LevelMask coolTriggerLevel;
  LevelMask humidityTriggerLevel;  // dehumidifier
  LevelMask soilTriggerLevel;      // pump
  LevelMask lightTriggerLevel;     // grow light
};

inline bool levelTriggers(LevelMask mask, SensorLevel level) {
  return (mask & (1 << level)) != 0;
}

// Only the low two bits of the selector are significant
CropProfile profileFromSelect(uint8_t select);

const ProfileThresholds& profileThresholds(CropProfile profile);
const char* profileName(CropProfile profile);

#endif // CROP_PROFILES_H
