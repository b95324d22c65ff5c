#ifndef DISPLAY_MANAGER_H
#define DISPLAY_MANAGER_H

#include <stdint.h>
#include "MenuState.h"

/* ---------- public API used by other modules ---------- */

/* redraw the one-line menu in place, selected item in inverse video */
void showMenu(MenuContext& ctx, const char* prefix);

/* "\r <label>: % 6d  " - overwrite the current readout line */
void showReadout(MenuContext& ctx, const char* label, int32_t value);

void newLine(MenuContext& ctx);

#endif
