#ifndef LED_MANAGER_H
#define LED_MANAGER_H

#include "MenuState.h"

/* cyan while proximity >= threshold, off otherwise */
void updateStatusLed(MenuContext& ctx);

void setStatusLed(StatusPixel& px, const Rgb& c);

#endif
