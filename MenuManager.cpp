#include "MenuManager.h"

#include "ActionManager.h"
#include "DisplayManager.h"
#include "EncoderManager.h"
#include "LedManager.h"
#include "LogManager.h"

static const char MAIN_PREFIX[] = "Main";

/* ═════════════════  INIT  ═════════════════ */
bool initMenu(MenuContext& ctx, const char** failed)
{
    ctx.pixel.begin();                    // first, so a fault can show red
    setStatusLed(ctx.pixel, LED_FAR);

    if (!ctx.knob.begin()) {
        logInfo(ctx.console, "ENC", "seesaw encoder not found or wrong firmware");
        if (failed) *failed = "seesaw encoder check failed";
        return false;
    }
    if (!ctx.sensor.begin()) {
        logInfo(ctx.console, "VCNL", "VCNL4040 not found");
        if (failed) *failed = "VCNL4040 check failed";
        return false;
    }
    ctx.state     = MenuState();
    ctx.mainClick = ClickEdge();
    logInfo(ctx.console, "MENU", "ready, threshold %ld", (long)ctx.state.threshold);
    return true;
}

/* ═════════════════  POLL  ═════════════════ */
void menuTick(MenuContext& ctx)
{
    ctx.pacer.sleepMs(MENU_POLL_MS);

    // redraw every pass, so a terminal attached later sees the menu at once
    showMenu(ctx, MAIN_PREFIX);

    KnobSample k = readKnob(ctx);
    if (ctx.mainClick.released(k.click)) doAction(ctx);
    if (k.delta != 0) selectBy(ctx, k.delta);

    updateStatusLed(ctx);
}

/* ═════════════════  FATAL  ═════════════════ */
void haltWithError(MenuContext& ctx, const char* reason)
{
    logInfo(ctx.console, "BOOT", "FATAL: %s", reason);
    setStatusLed(ctx.pixel, LED_FAULT);
    for (;;) ctx.pacer.sleepMs(HALT_SLEEP_MS);
}
