#ifndef APP_H
#define APP_H

#include "config.h"

// Prototypes for application-layer functions
void initializeCommunication();
bool isStatusUpdateDue();
void sendStatusUpdate();
void printDebugInfo();

#endif // APP_H
