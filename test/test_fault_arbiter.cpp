#include <gtest/gtest.h>

#include "fault_arbiter.h"
#include "policy_engine.h"

namespace {

FilteredReading allAt(SensorLevel level) {
  FilteredReading r;
  for (int ch = 0; ch < NUM_CHANNELS; ch++) {
    r.level[ch] = level;
    r.valid[ch] = true;
  }
  return r;
}

ActuatorIntent everything() {
  ActuatorIntent intent;
  intent.pump = intent.heater = intent.cooler = intent.light = intent.dehumidifier = true;
  return intent;
}

} // namespace

TEST(FaultArbiter, OverrideClearsEveryOutput) {
  FaultPolicy policy;
  FinalActuatorState out = arbitrate(everything(), allAt(LEVEL_LOW), true, policy);
  EXPECT_FALSE(out.actuators.pump);
  EXPECT_FALSE(out.actuators.heater);
  EXPECT_FALSE(out.actuators.cooler);
  EXPECT_FALSE(out.actuators.light);
  EXPECT_FALSE(out.actuators.dehumidifier);
  EXPECT_FALSE(out.fault);
}

TEST(FaultArbiter, PassesIntentThroughWithoutOverride) {
  FaultPolicy policy;
  ActuatorIntent intent;
  intent.pump = true;
  intent.dehumidifier = true;
  FinalActuatorState out = arbitrate(intent, allAt(LEVEL_MID), false, policy);
  EXPECT_TRUE(out.actuators.pump);
  EXPECT_FALSE(out.actuators.heater);
  EXPECT_FALSE(out.actuators.cooler);
  EXPECT_FALSE(out.actuators.light);
  EXPECT_TRUE(out.actuators.dehumidifier);
  EXPECT_FALSE(out.fault);
}

TEST(FaultArbiter, HeaterAndCoolerTogetherIsAFault) {
  FaultPolicy policy;
  policy.faultOnAllLow = false;
  ActuatorIntent intent;
  intent.heater = true;
  intent.cooler = true;
  EXPECT_TRUE(contradictoryDemand(intent));
  EXPECT_TRUE(arbitrate(intent, allAt(LEVEL_MID), false, policy).fault);

  intent.cooler = false;
  EXPECT_FALSE(arbitrate(intent, allAt(LEVEL_MID), false, policy).fault);
}

TEST(FaultArbiter, AllChannelsLowIsAFaultWhenEnabled) {
  FaultPolicy policy;
  ActuatorIntent intent = evaluatePolicy(allAt(LEVEL_LOW), PROFILE_RADISH);
  EXPECT_TRUE(arbitrate(intent, allAt(LEVEL_LOW), false, policy).fault);

  policy.faultOnAllLow = false;
  EXPECT_FALSE(arbitrate(intent, allAt(LEVEL_LOW), false, policy).fault);
}

TEST(FaultArbiter, ExtremeReadingsNeedEveryChannelQualified) {
  FilteredReading r = allAt(LEVEL_LOW);
  EXPECT_TRUE(extremeReadings(r));
  r.valid[CHANNEL_HUMIDITY] = false;
  EXPECT_FALSE(extremeReadings(r));

  r = allAt(LEVEL_LOW);
  r.level[CHANNEL_LIGHT] = LEVEL_MID;
  EXPECT_FALSE(extremeReadings(r));
}

TEST(FaultArbiter, RadishAllLowScenario) {
  FaultPolicy policy;
  FilteredReading r = allAt(LEVEL_LOW);
  FinalActuatorState out = arbitrate(evaluatePolicy(r, PROFILE_RADISH), r, false, policy);
  EXPECT_TRUE(out.actuators.heater);
  EXPECT_FALSE(out.actuators.cooler);
  EXPECT_TRUE(out.actuators.pump);
  EXPECT_TRUE(out.actuators.light);
  EXPECT_TRUE(out.actuators.dehumidifier);
  // Heater+cooler never coincide in the table; this one comes from all-Low
  EXPECT_TRUE(out.fault);
}

TEST(FaultArbiter, BuiltInProfilesNeverContradict) {
  const SensorLevel levels[] = {LEVEL_LOW, LEVEL_MID, LEVEL_HIGH};
  for (int p = 0; p < NUM_PROFILES; p++) {
    for (SensorLevel temp : levels) {
      ActuatorIntent intent = evaluatePolicy(allAt(temp), static_cast<CropProfile>(p));
      EXPECT_FALSE(contradictoryDemand(intent));
    }
  }
}
