#include "LogManager.h"

#include <stdarg.h>
#include <stdio.h>

void logInfo(Console& con, const char* tag, const char* fmt, ...)
{
    char line[LOG_LINE_LEN];

    int n = snprintf(line, sizeof(line), "[%s] ", tag);
    if (n < 0) return;
    if (n < (int)sizeof(line)) {
        va_list args;
        va_start(args, fmt);
        vsnprintf(line + n, sizeof(line) - n, fmt, args);
        va_end(args);
    }

    con.write(line);
    con.write("\r\n");
}
