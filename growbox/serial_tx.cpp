#include "serial_tx.h"

uint32_t bitPeriodTicks(uint32_t tickHz, uint32_t baud) {
  if (baud == 0) return 1;
  uint32_t ticks = (uint32_t)(((uint64_t)tickHz + baud / 2) / baud);
  return ticks == 0 ? 1 : ticks;
}

uint32_t frameTimingErrorPermille(uint32_t tickHz, uint32_t baud) {
  if (tickHz == 0 || baud == 0) return 0xFFFFFFFFUL;

  // |period * baud - tickHz| / tickHz is the per-bit error as a fraction of a bit
  uint64_t actual = (uint64_t)bitPeriodTicks(tickHz, baud) * baud;
  uint64_t diff = actual > tickHz ? actual - tickHz : tickHz - actual;
  return (uint32_t)((diff * 1000ULL * TX_FRAME_BITS) / tickHz);
}

bool telemetryTimingOk(uint32_t tickHz, uint32_t baud) {
  return frameTimingErrorPermille(tickHz, baud) < TX_TIMING_TOLERANCE_PERMILLE;
}

// =================================================================
// TRANSMITTER
// =================================================================

SerialTelemetryTx::SerialTelemetryTx(uint32_t bitPeriod) {
  this->bitPeriod = (bitPeriod == 0) ? 1 : bitPeriod;
  Reset();
}

void SerialTelemetryTx::Reset() {
  state = TX_IDLE;
  bitIndex = 0;
  divider = 0;
  shiftByte = 0;
  lastFault = false;
  retriggerPending = false;
  framesSent = 0;
}

void SerialTelemetryTx::Tick(bool fault, uint8_t statusByte) {
  bool rising = fault && !lastFault;
  lastFault = fault;

  if (state == TX_IDLE) {
    if (rising || (retriggerPending && fault)) {
      startFrame(statusByte);
    }
    retriggerPending = false;
    return;
  }

  if (rising) retriggerPending = true;

  divider++;
  if (divider >= bitPeriod) {
    divider = 0;
    advanceBit();
  }
}

void SerialTelemetryTx::startFrame(uint8_t statusByte) {
  shiftByte = statusByte;
  state = TX_START;
  bitIndex = 0;
  divider = 0;
}

void SerialTelemetryTx::advanceBit() {
  switch (state) {
    case TX_START:
      state = TX_DATA;
      bitIndex = 0;
      break;

    case TX_DATA:
      if (bitIndex < TX_DATA_BITS - 1) {
        bitIndex++;
      } else {
        state = TX_STOP;
      }
      break;

    case TX_STOP:
      state = TX_IDLE;
      bitIndex = 0;
      framesSent++;
      break;

    case TX_IDLE:
      break;
  }
}

bool SerialTelemetryTx::Line() const {
  switch (state) {
    case TX_START: return false;
    case TX_DATA:  return ((shiftByte >> bitIndex) & 0x01) != 0;
    case TX_STOP:  return true;
    default:       return true;
  }
}
