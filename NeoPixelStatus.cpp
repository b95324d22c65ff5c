// NeoPixelStatus.cpp

#include "NeoPixelStatus.h"

NeoPixelStatus::NeoPixelStatus()
  : px(1, PIN_NEOPIXEL, NEO_GRB + NEO_KHZ800)
{}

void NeoPixelStatus::begin() {
#if defined(NEOPIXEL_POWER)
    // QT Py / Feather ESP32-S2 & S3 gate the pixel supply
    pinMode(NEOPIXEL_POWER, OUTPUT);
    digitalWrite(NEOPIXEL_POWER, HIGH);
#endif
    px.begin();
    px.clear();
    px.show();
}

void NeoPixelStatus::setColor(uint8_t r, uint8_t g, uint8_t b) {
    px.setPixelColor(0, r, g, b);
    px.show();
}
