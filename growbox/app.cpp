#include "app.h"

static const char* LEVEL_NAMES[] = {"LOW", "MID", "HIGH"};

void initializeCommunication() {
  Serial.begin(CONSOLE_BAUD);
  Serial.println("Arduino Due Growbox Controller V1.0 Initializing...");

  SerialUSB.begin(CONSOLE_BAUD);
}

bool isStatusUpdateDue() {
  if (millis() - lastStatusUpdateTime >= (unsigned long)statusUpdateInterval) {
    lastStatusUpdateTime = millis();
    return true;
  }
  return false;
}

const char* levelName(const FilteredReading &reading, int channel) {
  if (!reading.valid[channel]) return "PENDING";
  return LEVEL_NAMES[reading.level[channel]];
}

void sendStatusUpdate() {
  StaticJsonDocument<512> doc;

  const FilteredReading &reading = controller.Filtered();
  const FinalActuatorState &state = controller.Final();

  doc["profile"] = profileName(controller.Controls().profile);
  doc["override"] = controller.Controls().overrideActive;

  JsonObject sensors = doc.createNestedObject("sensors");
  sensors["soil"]        = levelName(reading, CHANNEL_SOIL);
  sensors["light"]       = levelName(reading, CHANNEL_LIGHT);
  sensors["humidity"]    = levelName(reading, CHANNEL_HUMIDITY);
  sensors["temperature"] = levelName(reading, CHANNEL_TEMPERATURE);

  JsonObject relays = doc.createNestedObject("relays");
  relays["pump"]         = state.actuators.pump;
  relays["heater"]       = state.actuators.heater;
  relays["cooler"]       = state.actuators.cooler;
  relays["light"]        = state.actuators.light;
  relays["dehumidifier"] = state.actuators.dehumidifier;

  doc["fault"] = state.fault;
  doc["frames"] = controller.Telemetry().FramesSent();
  doc["outA"] = currentOutputs.a;
  doc["dropped"] = pacer.Dropped();

  if (rtcAvailable) {
    DateTime now = rtc.now();
    doc["time"] = now.timestamp(DateTime::TIMESTAMP_FULL);
  }

  String output;
  serializeJson(doc, output);

  if (SerialUSB) SerialUSB.println(output);
}

void printDebugInfo() {
  Serial.println("---[ DEBUG (Every 3s) ]---");

  if (rtcAvailable) {
    DateTime now = rtc.now();
    Serial.print("  RTC: ");
    Serial.print(now.hour()); Serial.print(':');
    Serial.println(now.minute());
  }

  Serial.print("  Profile: ");
  Serial.print(profileName(controller.Controls().profile));
  Serial.print(" | Override: ");
  Serial.println(controller.Controls().overrideActive ? "ON" : "OFF");

  Serial.print("  Out A: 0b");
  Serial.print(currentOutputs.a, BIN);
  Serial.print(" | Tick time: ");
  Serial.print((unsigned long)(controller.TickCount() / TICK_HZ));
  Serial.println(" s");

  Serial.println("---------------------------");
}
