#ifndef DRIVERS_H
#define DRIVERS_H

#include "config.h"

// Build the controller settings from the compile-time constants
ControllerConfig buildControllerConfig();

void setHardcodedTime();

#endif // DRIVERS_H
