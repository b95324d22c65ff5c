// SeesawKnob.h

#ifndef SEESAW_KNOB_H
#define SEESAW_KNOB_H

#include <Arduino.h>
#include <Adafruit_seesaw.h>
#include "Config.h"
#include "Devices.h"

/* Adafruit I2C QT rotary encoder (#4991 / #5880), seesaw firmware */
class SeesawKnob : public KnobDevice {
public:
    explicit SeesawKnob(Console& con, uint8_t addr = SEESAW_ADDR);

    // Must call before clicked()/delta(); false if absent or wrong firmware
    bool begin() override;

    bool    clicked() override;
    int32_t delta() override;

    uint32_t version() const { return ver; }

private:
    Adafruit_seesaw ss;
    Console& con;
    uint8_t  addr;
    uint32_t ver = 0;
};

#endif
