#ifndef TICK_PACER_H
#define TICK_PACER_H

#include <stdint.h>

// Turns a free-running microsecond clock into controller ticks.
// Each loop pass calls Begin(now) and then runs a tick for every Next() that
// returns true. A backlog is caught up in one pass, up to maxCatchup ticks.
// Once a telemetry frame is on the line only one tick runs per pass and the
// rest of the backlog is dropped, so no bit reaches the pin shorter than its
// period.
class TickPacer {
  public:
    TickPacer(unsigned long periodUs, unsigned long maxCatchup);

    void Reset(unsigned long nowUs);

    void Begin(unsigned long nowUs);
    bool Next(bool frameBusy);

    unsigned long PeriodUs() const { return periodUs; }
    unsigned long Pending() const { return pending; }
    unsigned long Dropped() const { return dropped; }

  private:
    void dropBacklog();

    unsigned long periodUs;
    unsigned long maxCatchup;
    unsigned long lastTickUs;
    unsigned long passUs;
    unsigned long pending;
    unsigned long ranThisPass;
    unsigned long dropped;
};

#endif // TICK_PACER_H
