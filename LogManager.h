#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include "Devices.h"

constexpr uint16_t LOG_LINE_LEN = 96;

/* "[TAG] message\r\n" on the console, truncated to LOG_LINE_LEN */
void logInfo(Console& con, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#endif
