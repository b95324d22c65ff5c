#ifndef BUS_PROBE_H
#define BUS_PROBE_H

#include <Arduino.h>
#include "Devices.h"

/* ping every expected I2C device and log "name @0xXX  OK/MISSING";
   returns the number of devices that did not ACK */
uint8_t probeBus(Console& con);

#endif
