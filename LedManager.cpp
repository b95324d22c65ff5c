#include "LedManager.h"

void setStatusLed(StatusPixel& px, const Rgb& c)
{
    px.setColor(c.r, c.g, c.b);
}

void updateStatusLed(MenuContext& ctx)
{
    bool inRange = ctx.sensor.proximity() >= ctx.state.threshold;
    setStatusLed(ctx.pixel, inRange ? LED_NEAR : LED_FAR);
}
