#ifndef ACTION_MANAGER_H
#define ACTION_MANAGER_H

#include "MenuState.h"

/* public API used by the event loop */
void doAction(MenuContext& ctx);        // run the selected item

/* menu item actions - each blocks until the knob is clicked */
void showProx(MenuContext& ctx);
void showLux(MenuContext& ctx);
void setThresh(MenuContext& ctx);

#endif   /* ACTION_MANAGER_H */
