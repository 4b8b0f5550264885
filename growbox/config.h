#ifndef CONFIG_H
#define CONFIG_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include <Wire.h>
#include <RTClib.h>
#include <SPI.h>
#include "io_map.h"
#include "grow_controller.h"
#include "tick_pacer.h"

// --- TICK PACING ---
// 104 us tick (~9.6 kHz); 8 ticks per bit at 1200 baud
const unsigned long TICK_PERIOD_US   = 104;
const uint32_t TICK_HZ               = 1000000UL / TICK_PERIOD_US;
const unsigned long MAX_CATCHUP_TICKS = 64;

// --- SENSOR FILTER ---
const uint32_t FILTER_WINDOW_US      = 5000;  // 5 ms qualification window
const uint32_t FILTER_QUALIFY_TICKS  = FILTER_WINDOW_US / TICK_PERIOD_US;

// --- FAULT TELEMETRY ---
const uint32_t TELEMETRY_BAUD        = 1200;
const bool FAULT_ON_ALL_LOW          = true;

// --- HEARTBEAT ---
const unsigned long HEARTBEAT_HALF_PERIOD_MS = 500;

// --- REPORTING ---
const long CONSOLE_BAUD              = 9600;
const unsigned long LOG_INTERVAL_MS  = 10000;

// =================================================================
// EXTERN DECLARATIONS
// =================================================================

extern RTC_DS3231 rtc;
extern GrowController controller;

extern unsigned long lastStatusUpdateTime;
extern const long statusUpdateInterval;
extern unsigned long lastLogTime;

extern TickPacer pacer;
extern OutputWords currentOutputs;
extern bool heartbeatState;
extern bool rtcAvailable;
extern bool sdLoggingEnabled;

#endif // CONFIG_H
