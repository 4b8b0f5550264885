#ifndef SERIAL_TX_H
#define SERIAL_TX_H

#include "grow_types.h"

enum TxState {
  TX_IDLE,
  TX_START,
  TX_DATA,
  TX_STOP
};

const int TX_DATA_BITS  = 8;
const int TX_FRAME_BITS = 10;  // start + 8 data + stop

// Largest accepted drift at the end of a frame, in thousandths of a bit
const uint32_t TX_TIMING_TOLERANCE_PERMILLE = 500;

// Ticks per bit, rounded to nearest, never 0
uint32_t bitPeriodTicks(uint32_t tickHz, uint32_t baud);

// Drift accumulated over one frame by the rounded divider
uint32_t frameTimingErrorPermille(uint32_t tickHz, uint32_t baud);

bool telemetryTimingOk(uint32_t tickHz, uint32_t baud);

// Fault-triggered 8N1 transmitter on a single idle-high line.
// Starts a frame on a rising edge of the fault input. Edges seen while a
// frame is on the line are not queued; if one happened, a new frame starts
// at the end of the current one only when the fault is still asserted.
class SerialTelemetryTx {
  public:
    explicit SerialTelemetryTx(uint32_t bitPeriod);

    // Aborts any frame in progress and clears the frame count
    void Reset();

    void Tick(bool fault, uint8_t statusByte);

    bool Line() const;
    TxState State() const { return state; }
    int BitIndex() const { return bitIndex; }
    bool Busy() const { return state != TX_IDLE; }
    uint8_t LatchedByte() const { return shiftByte; }
    uint32_t BitPeriod() const { return bitPeriod; }
    // Frames completed since the last reset
    uint32_t FramesSent() const { return framesSent; }

  private:
    void startFrame(uint8_t statusByte);
    void advanceBit();

    uint32_t bitPeriod;
    TxState state;
    int bitIndex;
    uint32_t divider;
    uint8_t shiftByte;
    bool lastFault;
    bool retriggerPending;
    uint32_t framesSent;
};

#endif // SERIAL_TX_H
