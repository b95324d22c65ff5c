#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>

/* ─────────────────────────────────────────────
   USER CONFIGURATION - change to fit your board
   ───────────────────────────────────────────── */

constexpr uint32_t SERIAL_BAUD        = 115200;

// I2C addresses
constexpr uint8_t  SEESAW_ADDR        = 0x36;   // encoder breakout, no A0-A2 straps
constexpr uint8_t  VCNL4040_ADDR      = 0x60;   // fixed on the VCNL4040

// seesaw encoder
constexpr uint8_t  SEESAW_BTN_PIN     = 24;     // knob push switch
constexpr uint16_t SEESAW_PRODUCT_ID  = 4991;   // upper 16 bits of getVersion()

/* ─────────────────────────────────────────────
   Timing (ms)                                  */
constexpr uint32_t MENU_POLL_MS       = 30;     // ~30 Hz, knob feels responsive
constexpr uint32_t READOUT_POLL_MS    = 100;    // 10 Hz, less flicker on readouts
constexpr uint32_t THRESH_POLL_MS     = 30;
constexpr uint32_t HALT_SLEEP_MS      = 500;

/* ─────────────────────────────────────────────
   Proximity threshold
   VCNL4040 proximity counts are roughly log scale over its ~200 mm range:
     2 ≈ 150..200 mm   4 ≈ 110..130 mm   6 ≈ 90..100 mm
     8 ≈  80..85 mm   60 ≈ 10 mm
   1 is the idle reading with nothing in front of the sensor.  */
constexpr int32_t  THRESH_MIN         = 2;
constexpr int32_t  THRESH_MAX         = 60;
constexpr int32_t  THRESH_DEFAULT     = 4;

/* ─────────────────────────────────────────────
   Status LED colours (r, g, b), kept dim      */
struct Rgb { uint8_t r, g, b; };

constexpr Rgb LED_NEAR  = { 0, 5, 5 };   // cyan: object within threshold
constexpr Rgb LED_FAR   = { 0, 0, 0 };   // off
constexpr Rgb LED_FAULT = { 5, 0, 0 };   // red: halted on startup error

#endif
