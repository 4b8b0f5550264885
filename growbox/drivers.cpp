#include "drivers.h"

// =================================================================
// GLOBAL VARIABLE DEFINITIONS
// =================================================================

RTC_DS3231 rtc;
GrowController controller(buildControllerConfig());

unsigned long lastStatusUpdateTime = 0;
const long statusUpdateInterval = 3000;
unsigned long lastLogTime = 0;

TickPacer pacer(TICK_PERIOD_US, MAX_CATCHUP_TICKS);
OutputWords currentOutputs;
bool heartbeatState = false;
bool rtcAvailable = false;
bool sdLoggingEnabled = false;

// =================================================================
// FUNCTIONS
// =================================================================

ControllerConfig buildControllerConfig() {
  ControllerConfig cfg;
  cfg.tickHz = TICK_HZ;
  cfg.filterQualifyTicks = FILTER_QUALIFY_TICKS;
  cfg.telemetryBaud = TELEMETRY_BAUD;
  cfg.faultPolicy.faultOnAllLow = FAULT_ON_ALL_LOW;
  return cfg;
}

void setHardcodedTime() {
  if (!rtcAvailable) return;
  if (rtc.lostPower()) {
    Serial.println("RTC lost power, setting default time...");
    rtc.adjust(DateTime(F(__DATE__), F(__TIME__)));
  }
}
