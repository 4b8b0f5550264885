#ifndef GROW_LOGIC_H
#define GROW_LOGIC_H

#include "config.h"

// =================================================================
// MAIN LOGIC INTERFACE
// =================================================================

// Called once at setup
void initializeLogic();

// Called every loop: runs the controller ticks that are due
void runControlTicks();

// True while a fault frame is on the telemetry line
bool telemetryBusy();

#endif // GROW_LOGIC_H
