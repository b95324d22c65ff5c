#ifndef DEVICES_H
#define DEVICES_H

#include <stdint.h>

/* ─────────────────────────────────────────────
   Hardware seams used by the menu core.
   Firmware implementations live in SeesawKnob, Vcnl4040Sensor,
   NeoPixelStatus and SerialConsole; host tests plug in fakes.   */

class KnobDevice {
public:
    virtual ~KnobDevice() {}

    virtual bool    begin()   = 0;
    virtual bool    clicked() = 0;   // true while the knob is held down
    virtual int32_t delta()   = 0;   // detents turned since the last call
};

class ProxSensor {
public:
    virtual ~ProxSensor() {}

    virtual bool     begin()     = 0;
    virtual uint16_t proximity() = 0;
    virtual uint16_t lux()       = 0;
};

class StatusPixel {
public:
    virtual ~StatusPixel() {}

    virtual void begin() = 0;
    virtual void setColor(uint8_t r, uint8_t g, uint8_t b) = 0;
};

class Console {
public:
    virtual ~Console() {}

    virtual void write(const char* s) = 0;

    // printf-style, truncated to PRINT_BUF_LEN - 1 characters
    void print(const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    static constexpr uint16_t PRINT_BUF_LEN = 96;
};

class Pacer {
public:
    virtual ~Pacer() {}

    virtual void sleepMs(uint32_t ms) = 0;
};

/* seesaw version word: product id in the upper 16 bits, date code below */
inline uint16_t seesawProductId(uint32_t version)
{
    return (version >> 16) & 0xFFFF;
}

bool isSupportedSeesaw(uint32_t version);

#endif
