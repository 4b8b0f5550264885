#include "tick_pacer.h"

TickPacer::TickPacer(unsigned long periodUs, unsigned long maxCatchup) {
  this->periodUs = (periodUs == 0) ? 1 : periodUs;
  this->maxCatchup = (maxCatchup == 0) ? 1 : maxCatchup;
  dropped = 0;
  Reset(0);
}

void TickPacer::Reset(unsigned long nowUs) {
  lastTickUs = nowUs;
  passUs = nowUs;
  pending = 0;
  ranThisPass = 0;
}

void TickPacer::Begin(unsigned long nowUs) {
  passUs = nowUs;
  ranThisPass = 0;

  // Unsigned subtraction keeps working across the micros() rollover
  unsigned long due = (nowUs - lastTickUs) / periodUs;
  if (due > maxCatchup) {
    dropped += due - maxCatchup;
    due = maxCatchup;
    lastTickUs = nowUs - due * periodUs;
  }
  pending = due;
}

bool TickPacer::Next(bool frameBusy) {
  if (pending == 0) return false;

  if (frameBusy && ranThisPass > 0) {
    dropBacklog();
    return false;
  }

  pending--;
  ranThisPass++;
  lastTickUs += periodUs;
  return true;
}

// The tick that put the line in its current state counts as "now"
void TickPacer::dropBacklog() {
  dropped += pending;
  pending = 0;
  lastTickUs = passUs;
}
