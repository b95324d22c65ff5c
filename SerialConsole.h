// SerialConsole.h

#ifndef SERIAL_CONSOLE_H
#define SERIAL_CONSOLE_H

#include <Arduino.h>
#include "Devices.h"

class SerialConsole : public Console {
public:
    // native USB boards: give the host up to 2 s to open the port
    void begin(uint32_t baud) {
        Serial.begin(baud);
        uint32_t t0 = millis();
        while (!Serial && millis() - t0 < 2000) delay(10);
    }
    void write(const char* s) override { Serial.print(s); }
};

class ArduinoPacer : public Pacer {
public:
    void sleepMs(uint32_t ms) override { delay(ms); }
};

#endif
