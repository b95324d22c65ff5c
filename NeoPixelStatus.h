// NeoPixelStatus.h

#ifndef NEOPIXEL_STATUS_H
#define NEOPIXEL_STATUS_H

#include <Arduino.h>
#include <Adafruit_NeoPixel.h>
#include "Devices.h"

/* the board's single on-board pixel */
class NeoPixelStatus : public StatusPixel {
public:
    NeoPixelStatus();

    void begin() override;
    void setColor(uint8_t r, uint8_t g, uint8_t b) override;

private:
    Adafruit_NeoPixel px;
};

#endif
