#ifndef GROW_CONTROLLER_H
#define GROW_CONTROLLER_H

#include "grow_types.h"
#include "sensor_filter.h"
#include "crop_profiles.h"
#include "policy_engine.h"
#include "fault_arbiter.h"
#include "serial_tx.h"

// Reference clock the default timing is expressed in
const uint32_t DEFAULT_TICK_HZ        = 25000000UL;
const uint32_t DEFAULT_TELEMETRY_BAUD = 9600;

struct ControllerConfig {
  uint32_t tickHz             = DEFAULT_TICK_HZ;
  uint32_t filterQualifyTicks = DEFAULT_FILTER_QUALIFY_TICKS;
  uint32_t telemetryBaud      = DEFAULT_TELEMETRY_BAUD;
  FaultPolicy faultPolicy;
};

// =================================================================
// WORD CODECS
// =================================================================

// Reserved code 3 reads as High
SensorLevel decodeSensorCode(uint8_t code);
SensorReading decodeSensorWord(uint8_t wordA);
uint8_t encodeSensorWord(const SensorReading &reading);

ControlInputs decodeControlWord(uint8_t wordB);

uint8_t encodeOutputWord(const FinalActuatorState &state, bool heartbeat);

// Telemetry payload: output word A layout without heartbeat and bit 7
uint8_t statusByte(const FinalActuatorState &state);

// =================================================================
// TICK PIPELINE
// =================================================================
// Once per tick: transmitter (on the previous tick's fault), filter,
// policy, arbiter. Output word A reflects this tick's inputs; word B bit 7
// carries the telemetry line.
class GrowController {
  public:
    explicit GrowController(const ControllerConfig &config = ControllerConfig());

    // Synchronous reset: filters, registered fault and any frame in flight
    void Reset();

    OutputWords Tick(uint8_t wordA, uint8_t wordB, bool heartbeat);

    const FilteredReading& Filtered() const { return filter.Reading(); }
    const ActuatorIntent& Intent() const { return intent; }
    const FinalActuatorState& Final() const { return finalState; }
    const ControlInputs& Controls() const { return controls; }
    const SensorFilter& Filter() const { return filter; }
    const SerialTelemetryTx& Telemetry() const { return tx; }
    const ControllerConfig& Config() const { return config; }
    // Ticks since reset; 64 bits so it does not wrap at 25 MHz
    uint64_t TickCount() const { return tickCount; }

  private:
    ControllerConfig config;
    SensorFilter filter;
    SerialTelemetryTx tx;

    ControlInputs controls;
    ActuatorIntent intent;
    FinalActuatorState finalState;

    // Registered for the transmitter on the next tick
    bool faultQ;
    uint8_t statusQ;

    uint64_t tickCount;
};

#endif // GROW_CONTROLLER_H
