#include "Devices.h"

#include <stdarg.h>
#include <stdio.h>

#include "Config.h"

void Console::print(const char* fmt, ...)
{
    char line[PRINT_BUF_LEN];

    va_list args;
    va_start(args, fmt);
    vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    write(line);
}

bool isSupportedSeesaw(uint32_t version)
{
    return seesawProductId(version) == SEESAW_PRODUCT_ID;
}
