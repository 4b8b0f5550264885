#include "crop_profiles.h"

// =================================================================
// PROFILE TABLE
// =================================================================
// Radish is the baseline. Basil heats at Mid as well, pea shoots cool from
// Mid upwards, sunflower dehumidifies from Mid upwards.

static const ProfileThresholds PROFILE_TABLE[NUM_PROFILES] = {
  // name          heat                        cool                         humidity                     soil         light
  { "RADISH",      TRIGGER_LOW,                TRIGGER_NEVER,               TRIGGER_LOW,                 TRIGGER_LOW, TRIGGER_LOW },
  { "BASIL",       TRIGGER_LOW | TRIGGER_MID,  TRIGGER_NEVER,               TRIGGER_LOW,                 TRIGGER_LOW, TRIGGER_LOW },
  { "PEA_SHOOTS",  TRIGGER_LOW,                TRIGGER_MID | TRIGGER_HIGH,  TRIGGER_LOW,                 TRIGGER_LOW, TRIGGER_LOW },
  { "SUNFLOWER",   TRIGGER_LOW,                TRIGGER_NEVER,               TRIGGER_MID | TRIGGER_HIGH,  TRIGGER_LOW, TRIGGER_LOW },
};

CropProfile profileFromSelect(uint8_t select) {
  return static_cast<CropProfile>(select & CTRL_PROFILE_MASK);
}

const ProfileThresholds& profileThresholds(CropProfile profile) {
  return PROFILE_TABLE[profile & CTRL_PROFILE_MASK];
}

const char* profileName(CropProfile profile) {
  return profileThresholds(profile).name;
}
