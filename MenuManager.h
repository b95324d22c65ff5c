#ifndef MENU_MANAGER_H
#define MENU_MANAGER_H

#include "MenuState.h"

/* bring up pixel, knob and sensor; logs and returns false on the first
   failure, naming the device that failed in *failed when given */
bool initMenu(MenuContext& ctx, const char** failed = nullptr);

/* one pass of the main event loop, call from loop() */
void menuTick(MenuContext& ctx);

/* log, paint the pixel red and never return */
void haltWithError(MenuContext& ctx, const char* reason);

#endif
