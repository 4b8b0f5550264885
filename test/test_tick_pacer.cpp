#include <gtest/gtest.h>
#include <vector>

#include "tick_pacer.h"
#include "grow_controller.h"

namespace {

// Firmware timing: 104 us tick, 5 ms filter, 1200 baud, 64-tick catch-up cap
const unsigned long PERIOD_US = 104;
const unsigned long MAX_CATCHUP = 64;

ControllerConfig firmwareConfig() {
  ControllerConfig cfg;
  cfg.tickHz = 1000000UL / PERIOD_US;
  cfg.filterQualifyTicks = 5000 / PERIOD_US;
  cfg.telemetryBaud = 1200;
  return cfg;
}

struct Edge {
  unsigned long us;
  bool level;
};

// Same shape as runControlTicks(), with the clock handed in
class LoopHarness {
  public:
    LoopHarness() : ctrl(firmwareConfig()), pacer(PERIOD_US, MAX_CATCHUP), line(true) {
      pacer.Reset(0);
    }

    void pass(unsigned long nowUs, uint8_t wordA, uint8_t wordB) {
      pacer.Begin(nowUs);
      while (pacer.Next(ctrl.Telemetry().Busy())) {
        OutputWords out = ctrl.Tick(wordA, wordB, false);
        bool level = (out.b & OUT_BIT_TELEMETRY) != 0;
        if (level != line) {
          Edge e = {nowUs, level};
          edges.push_back(e);
          line = level;
        }
      }
    }

    bool lineAt(unsigned long us) const {
      bool level = true;
      for (size_t i = 0; i < edges.size() && edges[i].us <= us; i++) level = edges[i].level;
      return level;
    }

    GrowController ctrl;
    TickPacer pacer;
    std::vector<Edge> edges;
    bool line;
};

} // namespace

TEST(TickPacer, CatchUpIsCappedAndTheRestDropped) {
  TickPacer pacer(PERIOD_US, MAX_CATCHUP);
  pacer.Reset(0);
  pacer.Begin(96 * PERIOD_US + 10);
  EXPECT_EQ(MAX_CATCHUP, pacer.Pending());
  EXPECT_EQ(32ul, pacer.Dropped());

  unsigned long ran = 0;
  while (pacer.Next(false)) ran++;
  EXPECT_EQ(MAX_CATCHUP, ran);

  pacer.Begin(96 * PERIOD_US + 10);
  EXPECT_EQ(0ul, pacer.Pending());
}

TEST(TickPacer, RunsOneTickPerPassWhileFrameBusy) {
  TickPacer pacer(PERIOD_US, MAX_CATCHUP);
  pacer.Reset(0);
  pacer.Begin(9 * PERIOD_US);
  EXPECT_TRUE(pacer.Next(true));
  EXPECT_FALSE(pacer.Next(true));
  EXPECT_EQ(8ul, pacer.Dropped());
  EXPECT_EQ(0ul, pacer.Pending());

  // Next tick is one full period after the pass that ran
  pacer.Begin(10 * PERIOD_US - 1);
  EXPECT_EQ(0ul, pacer.Pending());
  pacer.Begin(10 * PERIOD_US);
  EXPECT_EQ(1ul, pacer.Pending());
}

TEST(TickPacer, SurvivesClockRollover) {
  TickPacer pacer(PERIOD_US, MAX_CATCHUP);
  unsigned long start = (unsigned long)-1 - 50;
  pacer.Reset(start);
  pacer.Begin(start + 2 * PERIOD_US + 3);
  EXPECT_EQ(2ul, pacer.Pending());
}

// A backlog that ends in a fault must not squeeze the frame into one pass
TEST(TickPacer, FrameStartedInsideBacklogKeepsFullBitPeriods) {
  LoopHarness loop;
  const uint8_t allLow = 0x00;
  const uint8_t radish = 0x00;
  ASSERT_EQ(8u, loop.ctrl.Telemetry().BitPeriod());
  const unsigned long bitUs = loop.ctrl.Telemetry().BitPeriod() * PERIOD_US;

  // First pass comes late: 67 ticks due, filter qualifies inside the batch
  loop.pass(7000, allLow, radish);
  ASSERT_TRUE(loop.ctrl.Telemetry().Busy());
  ASSERT_EQ(1u, loop.edges.size());
  EXPECT_EQ(7000ul, loop.edges[0].us);
  EXPECT_FALSE(loop.edges[0].level);

  for (unsigned long t = 7001; t <= 7000 + 12 * bitUs; t++) loop.pass(t, allLow, radish);

  ASSERT_GE(loop.edges.size(), 2u);
  EXPECT_EQ(bitUs, loop.edges[1].us - loop.edges[0].us);

  // Receiver sampling mid-bit at the nominal rate
  const unsigned long start = loop.edges[0].us;
  EXPECT_FALSE(loop.lineAt(start + bitUs / 2));
  uint8_t decoded = 0;
  for (int bit = 0; bit < 8; bit++) {
    if (loop.lineAt(start + (bit + 1) * bitUs + bitUs / 2)) decoded |= (uint8_t)(1 << bit);
  }
  EXPECT_TRUE(loop.lineAt(start + 9 * bitUs + bitUs / 2));

  const uint8_t expected = OUT_BIT_PUMP | OUT_BIT_HEATER | OUT_BIT_LIGHT |
                           OUT_BIT_FAULT | OUT_BIT_DEHUMIDIFIER;
  EXPECT_EQ(expected, decoded);
  EXPECT_EQ(1u, loop.ctrl.Telemetry().FramesSent());
}
