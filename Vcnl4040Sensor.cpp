// Vcnl4040Sensor.cpp

#include "Vcnl4040Sensor.h"
#include "LogManager.h"

bool Vcnl4040Sensor::begin() {
    if (!vcnl.begin(VCNL4040_ADDR, &Wire)) {
        logInfo(con, "VCNL", "init: no response");
        return false;
    }
    return true;
}

uint16_t Vcnl4040Sensor::proximity() {
    return vcnl.getProximity();
}

// getLux() scales the ambient count by the current integration time
uint16_t Vcnl4040Sensor::lux() {
    return vcnl.getLux();
}
