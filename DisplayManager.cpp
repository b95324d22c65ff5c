/* ---------------- DisplayManager.cpp ---------------- */
#include "DisplayManager.h"

/*
 * The menu never ends with a newline: every redraw starts with CR and
 * overwrites the same console row. After an action has printed its own
 * lines, state.newline asks for one line break first so the redraw does
 * not stomp on the action's last line.
 */

/* ─────────────────────────────────────────── */
/* 1.  MENU ROW                                */
/* ─────────────────────────────────────────── */
static void paintItem(Console& con, const MenuItem& it, bool sel)
{
    if (sel) con.write(ANSI_INVERSE);
    con.print(" %s ", it.name);
    if (sel) con.write(ANSI_NORMAL);
}

void showMenu(MenuContext& ctx, const char* prefix)
{
    Console& con = ctx.console;

    if (ctx.state.newline) {
        ctx.state.newline = false;
        newLine(ctx);
    }
    con.print("\r%s: ", prefix);                   // CR back to left margin
    for (uint8_t i = 0; i < ctx.itemCount; ++i)
        paintItem(con, ctx.items[i], i == ctx.state.selection);
}

/* ─────────────────────────────────────────── */
/* 2.  READOUT LINE                            */
/* ─────────────────────────────────────────── */
void showReadout(MenuContext& ctx, const char* label, int32_t value)
{
    ctx.console.print("\r %s: % 6ld  ", label, (long)value);
}

void newLine(MenuContext& ctx)
{
    ctx.console.write("\r\n");
}
