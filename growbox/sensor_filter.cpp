#include "sensor_filter.h"

SensorFilter::SensorFilter(uint32_t qualifyTicks) {
  // A zero window would accept every glitch; one tick is the floor.
  this->qualifyTicks = (qualifyTicks == 0) ? 1 : qualifyTicks;
  Reset();
}

void SensorFilter::Reset() {
  for (int ch = 0; ch < NUM_CHANNELS; ch++) {
    channels[ch].candidate = LEVEL_HIGH;
    channels[ch].runLength = 0;
    reading.level[ch] = LEVEL_HIGH;
    reading.valid[ch] = false;
  }
}

void SensorFilter::Tick(const SensorReading &raw) {
  for (int ch = 0; ch < NUM_CHANNELS; ch++) {
    tickChannel(ch, raw.level[ch]);
  }
}

void SensorFilter::tickChannel(int channel, SensorLevel raw) {
  ChannelState &st = channels[channel];

  if (raw == st.candidate) {
    st.runLength++;
  } else {
    // No partial credit: a new candidate starts its own run
    st.candidate = raw;
    st.runLength = 1;
  }

  if (st.runLength >= qualifyTicks) {
    reading.level[channel] = st.candidate;
    reading.valid[channel] = true;
    st.runLength = 0;
  }
}

uint32_t SensorFilter::RunLength(SensorChannel channel) const {
  return channels[channel].runLength;
}

SensorLevel SensorFilter::Candidate(SensorChannel channel) const {
  return channels[channel].candidate;
}
