// Vcnl4040Sensor.h

#ifndef VCNL4040_SENSOR_H
#define VCNL4040_SENSOR_H

#include <Arduino.h>
#include <Wire.h>
#include <Adafruit_VCNL4040.h>
#include "Config.h"
#include "Devices.h"

class Vcnl4040Sensor : public ProxSensor {
public:
    explicit Vcnl4040Sensor(Console& con) : con(con) {}

    bool begin() override;

    uint16_t proximity() override;
    uint16_t lux() override;

private:
    Adafruit_VCNL4040 vcnl;
    Console& con;
};

#endif
