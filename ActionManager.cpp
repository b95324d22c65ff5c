/* ───── ActionManager.cpp ─────────────────────────────────────────────── */
#include "ActionManager.h"

#include "DisplayManager.h"
#include "EncoderManager.h"
#include "LedManager.h"

/* ===================================================================== */
/*  Menu table                                                           */
/* ===================================================================== */
const MenuItem menuItems[MENU_COUNT] = {
    { "Show Proximity", showProx  },
    { "Show Lux",       showLux   },
    { "Set Threshold",  setThresh },
};

/* ===================================================================== */
/*  Dispatcher                                                           */
/* ===================================================================== */
void doAction(MenuContext& ctx)
{
    newLine(ctx);                         // menu row has no trailing newline

    const MenuItem& it = ctx.items[ctx.state.selection];
    if (it.action == nullptr) {
        ctx.console.print("%s menu action is not callable\r\n", it.name);
    } else {
        it.action(ctx);
    }

    ctx.state.newline = true;             // don't redraw over our output
}

/* ===================================================================== */
/*  Sensor readouts (click to go back)                                   */
/* ===================================================================== */
typedef uint16_t (ProxSensor::*Reading)();

static void runReadout(MenuContext& ctx, const char* label, Reading read)
{
    ClickEdge edge;

    for (;;) {
        ctx.pacer.sleepMs(READOUT_POLL_MS);
        showReadout(ctx, label, (ctx.sensor.*read)());

        if (edge.released(ctx.knob.clicked())) {
            newLine(ctx);
            return;
        }
        updateStatusLed(ctx);
    }
}

void showProx(MenuContext& ctx)
{
    ctx.console.write("VCNL4040 Proximity (click to go back):\r\n");
    runReadout(ctx, "proximity", &ProxSensor::proximity);
}

void showLux(MenuContext& ctx)
{
    ctx.console.write("VCNL4040 Ambient Lux (click to go back):\r\n");
    runReadout(ctx, "lux", &ProxSensor::lux);
}

/* ===================================================================== */
/*  Threshold edit (click to save)                                       */
/* ===================================================================== */
void setThresh(MenuContext& ctx)
{
    ctx.console.print("Proximity threshold, range %ld..%ld (click to save):\r\n",
                      (long)THRESH_MIN, (long)THRESH_MAX);
    ClickEdge edge;

    for (;;) {
        ctx.pacer.sleepMs(THRESH_POLL_MS);
        showReadout(ctx, "threshold", ctx.state.threshold);

        KnobSample k = readKnob(ctx);
        if (edge.released(k.click)) {
            newLine(ctx);
            return;
        }
        // live: the LED follows the value being dialled in
        if (k.delta != 0) nudgeThreshold(ctx, k.delta);

        updateStatusLed(ctx);
    }
}
/* ─────────────────────────────────────────────────────────────────────── */
