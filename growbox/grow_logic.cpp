#include "grow_logic.h"
#include "hal.h"       // Needs readSensorWord(), applyOutputWords()

static bool lastFaultReported = false;
static uint32_t lastFramesSent = 0;

// =================================================================
// HELPERS
// =================================================================

bool updateHeartbeat() {
  heartbeatState = ((millis() / HEARTBEAT_HALF_PERIOD_MS) % 2) != 0;
  return heartbeatState;
}

void reportFaultEvents() {
  bool fault = controller.Final().fault;
  if (fault != lastFaultReported) {
    lastFaultReported = fault;
    Serial.print(fault ? "FAULT asserted, profile " : "Fault cleared, profile ");
    Serial.println(profileName(controller.Controls().profile));
  }

  uint32_t frames = controller.Telemetry().FramesSent();
  if (frames != lastFramesSent) {
    lastFramesSent = frames;
    Serial.print("Telemetry frame sent: 0x");
    Serial.println(controller.Telemetry().LatchedByte(), HEX);
  }
}

// =================================================================
// MAIN INTERFACE FUNCTIONS
// =================================================================

void initializeLogic() {
  const ControllerConfig &cfg = controller.Config();
  Serial.print("Filter window: "); Serial.print(controller.Filter().QualifyTicks());
  Serial.print(" ticks @ "); Serial.print(cfg.tickHz); Serial.println(" Hz");

  Serial.print("Telemetry: "); Serial.print(cfg.telemetryBaud);
  Serial.print(" baud, "); Serial.print(controller.Telemetry().BitPeriod());
  Serial.println(" ticks/bit");
  if (!telemetryTimingOk(cfg.tickHz, cfg.telemetryBaud)) {
    Serial.print("WARNING: telemetry frame drift ");
    Serial.print(frameTimingErrorPermille(cfg.tickHz, cfg.telemetryBaud));
    Serial.println(" permille of a bit, receiver may misframe.");
  }

  controller.Reset();
  currentOutputs = OutputWords();
  applyOutputWords(currentOutputs);
  lastFaultReported = false;
  lastFramesSent = 0;
  pacer.Reset(micros());
}

void runControlTicks() {
  pacer.Begin(micros());
  if (pacer.Pending() == 0) return;

  bool heartbeat = updateHeartbeat();
  while (pacer.Next(controller.Telemetry().Busy())) {
    uint8_t wordA = readSensorWord();
    uint8_t wordB = readControlWord();
    currentOutputs = controller.Tick(wordA, wordB, heartbeat);
    applyOutputWords(currentOutputs);
  }

  reportFaultEvents();
}

bool telemetryBusy() {
  return controller.Telemetry().Busy();
}
