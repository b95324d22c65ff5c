// SeesawKnob.cpp

#include "SeesawKnob.h"
#include "LogManager.h"

SeesawKnob::SeesawKnob(Console& con, uint8_t addr)
  : ss(&Wire), con(con), addr(addr)
{}

bool SeesawKnob::begin() {
    if (!ss.begin(addr)) {
        logInfo(con, "ENC", "no seesaw at 0x%02X", addr);
        return false;
    }

    ver = ss.getVersion();
    logInfo(con, "ENC", "seesaw product id %u", (unsigned)seesawProductId(ver));
    if (!isSupportedSeesaw(ver)) {
        logInfo(con, "ENC", "unexpected seesaw firmware version");
        return false;
    }

    ss.pinMode(SEESAW_BTN_PIN, INPUT_PULLUP);   // knob switch pulls LOW
    return true;
}

bool SeesawKnob::clicked() {
    return !ss.digitalRead(SEESAW_BTN_PIN);
}

int32_t SeesawKnob::delta() {
    return ss.getEncoderDelta();
}
