/*
  logger.cpp - Handles SD Card Logging
*/
#include "logger.h"
#include "config.h"
#include <SPI.h>
#include <SD.h>

// Definitions
const char* LOG_FILENAME = "growlog.csv";

void initializeLogger() {
  Serial.print("Initializing SD Card on CS Pin ");
  Serial.print(SD_CS_PIN);
  Serial.println("...");

  if (!SD.begin(SD_CS_PIN)) {
    Serial.println("SD Card Initialization FAILED! Logging disabled.");
    sdLoggingEnabled = false;
    return;
  }
  Serial.println("SD Card Initialized.");
  sdLoggingEnabled = true;

  // Check if file exists. If NO, create it and write the header.
  if (!SD.exists(LOG_FILENAME)) {
    File logFile = SD.open(LOG_FILENAME, FILE_WRITE);
    if (logFile) {
      logFile.println("date,time,profile,override,soil,light,humidity,temp,pump,heater,cooler,lamp,dehum,fault,frames");
      logFile.close();
      Serial.println("Created new log file with headers.");
    }
  }
}

bool isLogDue() {
  if (millis() - lastLogTime >= LOG_INTERVAL_MS) {
    lastLogTime = millis();
    return true;
  }
  return false;
}

void printLevel(File &logFile, const FilteredReading &reading, int channel) {
  // -1 until the channel has qualified
  if (reading.valid[channel]) logFile.print((int)reading.level[channel]);
  else logFile.print("-1");
  logFile.print(",");
}

void logSystemData() {
  if (!sdLoggingEnabled) return;

  File logFile = SD.open(LOG_FILENAME, FILE_WRITE);

  if (logFile) {
    char buf[20];

    if (rtcAvailable) {
      DateTime now = rtc.now();

      // 1. Date (YYYY-MM-DD)
      sprintf(buf, "%04d-%02d-%02d", now.year(), now.month(), now.day());
      logFile.print(buf);
      logFile.print(",");

      // 2. Time (HH:MM:SS)
      sprintf(buf, "%02d:%02d:%02d", now.hour(), now.minute(), now.second());
      logFile.print(buf);
      logFile.print(",");
    } else {
      logFile.print(",,");
    }

    // 3. Profile / override
    logFile.print(profileName(controller.Controls().profile));
    logFile.print(",");
    logFile.print(controller.Controls().overrideActive ? "1" : "0");
    logFile.print(",");

    // --- FILTERED LEVELS ---
    const FilteredReading &reading = controller.Filtered();
    printLevel(logFile, reading, CHANNEL_SOIL);
    printLevel(logFile, reading, CHANNEL_LIGHT);
    printLevel(logFile, reading, CHANNEL_HUMIDITY);
    printLevel(logFile, reading, CHANNEL_TEMPERATURE);

    // --- RELAY STATES ---
    const FinalActuatorState &state = controller.Final();
    logFile.print(state.actuators.pump ? "1" : "0");
    logFile.print(",");
    logFile.print(state.actuators.heater ? "1" : "0");
    logFile.print(",");
    logFile.print(state.actuators.cooler ? "1" : "0");
    logFile.print(",");
    logFile.print(state.actuators.light ? "1" : "0");
    logFile.print(",");
    logFile.print(state.actuators.dehumidifier ? "1" : "0");
    logFile.print(",");
    logFile.print(state.fault ? "1" : "0");
    logFile.print(",");

    // Frames (Last item, NO comma)
    logFile.print(controller.Telemetry().FramesSent());

    logFile.println(); // End Line
    logFile.close();
  } else {
    Serial.println("Error opening log file for writing.");
  }
}
