#ifndef IO_MAP_H
#define IO_MAP_H

// =================================================================
// PIN DEFINITIONS
// =================================================================

// --- Input word A: quantizer outputs, bit 7 first (soil hi .. temp lo) ---
const int SENSOR_WORD_PINS[8] = {22, 23, 24, 25, 26, 27, 28, 29};

// --- Input word B: override switch + 2-bit profile selector ---
const int OVERRIDE_PIN        = 30;
const int PROFILE_SEL0_PIN    = 31;
const int PROFILE_SEL1_PIN    = 32;

// Define CS Pin for SD Card
const int SD_CS_PIN = 10;

// --- 5-Channel Relay Card Pins (A0-A4) ---
const int RELAY_PIN_PUMP         = A0;
const int RELAY_PIN_HEATER       = A1;
const int RELAY_PIN_COOLER       = A2;
const int RELAY_PIN_LIGHT        = A3;
const int RELAY_PIN_DEHUMIDIFIER = A4;

// --- Indicators ---
const int FAULT_LED_PIN     = 34;
const int HEARTBEAT_LED_PIN = LED_BUILTIN;

// --- Fault telemetry line (bit-banged, idle high) ---
const int TELEMETRY_TX_PIN  = 35;

// =================================================================
// RELAY LOGIC (Normally Open - NO)
// =================================================================
// ACTIVE LOW Logic for standard Relay Modules
// LOW  = Energize (Switch Closed -> ON)
// HIGH = De-energize (Switch Open -> OFF)

const int RELAY_ON  = LOW;
const int RELAY_OFF = HIGH;

#endif // IO_MAP_H
