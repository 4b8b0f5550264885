#ifndef HAL_H
#define HAL_H

#include "config.h"

// Prototypes for HAL functions
void initializePins();
void initializeSensors();
uint8_t readSensorWord();
uint8_t readControlWord();
void applyOutputWords(const OutputWords &out);

#endif // HAL_H
