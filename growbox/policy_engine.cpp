#include "policy_engine.h"

static bool channelDemands(const FilteredReading &reading, SensorChannel channel, LevelMask trigger) {
  if (!reading.valid[channel]) return false;
  return levelTriggers(trigger, reading.level[channel]);
}

ActuatorIntent evaluatePolicy(const FilteredReading &reading, const ProfileThresholds &thresholds) {
  ActuatorIntent intent;
  intent.pump         = channelDemands(reading, CHANNEL_SOIL,        thresholds.soilTriggerLevel);
  intent.light        = channelDemands(reading, CHANNEL_LIGHT,       thresholds.lightTriggerLevel);
  intent.heater       = channelDemands(reading, CHANNEL_TEMPERATURE, thresholds.heatTriggerLevel);
  intent.cooler       = channelDemands(reading, CHANNEL_TEMPERATURE, thresholds.coolTriggerLevel);
  intent.dehumidifier = channelDemands(reading, CHANNEL_HUMIDITY,    thresholds.humidityTriggerLevel);
  return intent;
}

ActuatorIntent evaluatePolicy(const FilteredReading &reading, CropProfile profile) {
  return evaluatePolicy(reading, profileThresholds(profile));
}
