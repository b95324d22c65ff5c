/* ───── BusProbe.cpp ───── */
#include "BusProbe.h"
#include <Wire.h>
#include "Config.h"
#include "LogManager.h"

struct Dev { const char* name; uint8_t addr; };

static const Dev devs[] = {
    { "seesaw enc", SEESAW_ADDR   },
    { "VCNL4040",   VCNL4040_ADDR },
};

uint8_t probeBus(Console& con)
{
    uint8_t missing = 0;

    for (const auto& d : devs)
    {
        Wire.beginTransmission(d.addr);
        bool ok = (Wire.endTransmission() == 0);
        if (!ok) ++missing;

        logInfo(con, "I2C", "%-12s @0x%02X  %s",
                d.name, d.addr, ok ? "OK" : "MISSING");
    }
    return missing;
}
