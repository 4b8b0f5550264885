#ifndef SENSOR_FILTER_H
#define SENSOR_FILTER_H

#include "grow_types.h"

// Default qualification window: 4 ms of a 25 MHz tick
const uint32_t DEFAULT_FILTER_QUALIFY_TICKS = 100000UL;

// Debounces the four sensor channels independently. A raw code has to be
// seen on every tick of the qualification window before it is accepted.
class SensorFilter {
  public:
    explicit SensorFilter(uint32_t qualifyTicks = DEFAULT_FILTER_QUALIFY_TICKS);

    void Reset();

    // Advance one tick with this tick's raw sample
    void Tick(const SensorReading &raw);

    const FilteredReading& Reading() const { return reading; }
    uint32_t RunLength(SensorChannel channel) const;
    SensorLevel Candidate(SensorChannel channel) const;
    uint32_t QualifyTicks() const { return qualifyTicks; }

  private:
    struct ChannelState {
      SensorLevel candidate;
      uint32_t runLength;
    };

    void tickChannel(int channel, SensorLevel raw);

    uint32_t qualifyTicks;
    ChannelState channels[NUM_CHANNELS];
    FilteredReading reading;
};

#endif // SENSOR_FILTER_H
